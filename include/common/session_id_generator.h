// include/common/session_id_generator.h
#pragma once

#include <string>

namespace photobooth::common {

// SessionIdGenerator - one id per photo session, also used as its folder name
class SessionIdGenerator {
public:
    // Format: YYYYMMDD-HHMMSS-xxxxxx (local time, 6 random hex digits)
    static std::string generate();
};

} // namespace photobooth::common
