#pragma once

namespace media_grab::downloader {

// How a failed backend attempt should be handled by the retry controller
enum class FailureType {
    TRANSIENT,       // Generic non-zero result: retry same backend, then switch
    TIMEOUT,         // Backend exceeded its time bound; handled like TRANSIENT
    ACCESS_BLOCKED,  // Block/region/403 signature: proxy retry, backoff, then switch
    AUTHENTICATION,  // Cookie rejected: next cookie candidate before switching
    CONFIGURATION,   // Backend tool unresolvable: skip immediately, never retried
    PERMANENT        // Content gone or private: switch without retrying
};

} // namespace media_grab::downloader
