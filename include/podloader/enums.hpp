#ifndef PODLOADER_ENUMS_HPP
#define PODLOADER_ENUMS_HPP

#define AUDIOEXT ".mp3"
#define TMPEXT ".tmp"
#define UNKNOWN_DATE "unknown-date"
#define DONE_DIRNAME "done"

namespace podloader
{
    enum class EpisodeStatus
    {
        // Imported, waiting for a transfer (or for a retry timer).
        kPENDING,
        // A transfer is registered and running.
        kDOWNLOADING,
        // The file is complete under its final name.
        kDOWNLOADED,
        // Terminal failure, retries exhausted or failure not retryable.
        kFAILED,
        // Handed over to the transcription tool.
        kTRANSCRIBING,
        // Transcription finished, file lives in the done directory.
        kTRANSCRIBED,
    };

    enum class HeaderCbState
    {
        // Default state
        kDEFAULT,
        // HTTP status line received with a 2xx code
        kHTTP_STATE_OK,
        // HTTP status line received with any other code (redirect, error)
        kHTTP_STATE_NOT_OK,
    };

    enum class RetryDecision
    {
        // A retry timer has been armed.
        kSCHEDULED,
        // The episode has been marked as failed.
        kFAILED,
        // Nothing was scheduled (cancellation, pre-flight errors, re-entry).
        kSKIPPED,
    };

    enum class QueueEventType
    {
        kSTARTED,
        kCOMPLETED,
        kFAILED,
        // An active transfer was cancelled by a pause.
        kPAUSED,
        // A paused transfer was put back in front of the queue.
        kRESUMED,
    };

    /** Download error codes */
    enum class ErrorCode
    {
        // not enough free space in the download directory (pre-flight)
        kINSUFFICIENT_SPACE,
        // connection, DNS, timeout or transport level failure
        kNETWORK,
        // the server answered with a status code which does not represent success
        kHTTP_STATUS,
        // writing the temporary file failed
        kWRITE,
        // the transfer was cancelled by the user
        kCANCELLED,
        // the temporary file vanished before it could be finalized
        kMISSING_TEMP_FILE,
        // the audio url is not an absolute url with an allowed scheme
        kBAD_URL,
        // a transfer is already registered for this episode
        kALREADY_ACTIVE,
        // the episode has no record in the store
        kNOT_FOUND,
        // a manual retry was refused because all attempts are used up
        kRETRIES_EXHAUSTED,
        // other filesystem errors (rename, directory creation, ...)
        kIO,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };
}

#endif
