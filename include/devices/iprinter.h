// include/devices/iprinter.h
#pragma once

#include "devices/device_types.h"
#include <string>

namespace photobooth::devices {

// IPrinter interface - hands finished files to a print spooler queue
class IPrinter {
public:
    virtual ~IPrinter() = default;

    // Blocking submission of filePath to queueName. Called from the task worker only.
    // Setting the token from any thread aborts the submission.
    virtual SpoolResult printFile(const std::string& filePath, const std::string& queueName,
                                  CancelToken cancel) = 0;
};

} // namespace photobooth::devices
