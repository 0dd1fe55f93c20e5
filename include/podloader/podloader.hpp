#ifndef PODLOADER_HPP
#define PODLOADER_HPP

// Project version
#define PODLOADER_VERSION_MAJOR 0
#define PODLOADER_VERSION_MINOR 3
#define PODLOADER_VERSION_PATCH 0

#include <podloader/context.hpp>
#include <podloader/episode.hpp>
#include <podloader/episode_store.hpp>
#include <podloader/naming.hpp>
#include <podloader/pipeline.hpp>

#endif
