// include/vendor_adapters/cups/cups_printer_adapter.h
#pragma once

#include "devices/iprinter.h"
#include <chrono>
#include <string>
#include <vector>

namespace photobooth::cups {

struct CupsSettings {
    std::string lpCommand{"lp"};
    std::vector<std::string> options{"media=A4.Borderless", "fit-to-page=false"};
    std::chrono::milliseconds timeout{60000};
};

/// CUPS printer adapter. Submits files with the lp client:
///   lp -d <queue> -o <option>... <file>
/// An lp exit code of 0 means the spooler accepted the job.
class CupsPrinterAdapter : public devices::IPrinter {
public:
    CupsPrinterAdapter(const std::string& deviceId, CupsSettings settings);
    ~CupsPrinterAdapter() override = default;

    devices::SpoolResult printFile(const std::string& filePath, const std::string& queueName,
                                   devices::CancelToken cancel) override;

    std::vector<std::string> buildCommand(const std::string& filePath, const std::string& queueName) const;

private:
    std::string deviceId_;
    CupsSettings settings_;
};

} // namespace photobooth::cups
