#include "tally_log.hpp"
#include <future>
#include <iostream>
#include <vector>

// Folder layout produced under the log root:
//   logs/
//   ├── json/   <- JSON-Lines files, one per level
//   └── csv/    <- CSV files, one per level

int main() {
    try {
        // Default root (TALLY_LOG_DIR or data/logs), JSON by default.
        tally::LogManager log;

        // Only warning, error and critical reach a file by default.
        log.debug("This is a debug message");        // console only
        log.info("This is an info message");         // console only
        log.warning("This is a warning message");    // json/warning.json
        log.error("This is an error message");       // json/error.json
        log.critical("This is a critical message");  // json/critical.json

        // Ask for the file explicitly for debug and info.
        log.debug("debug worth keeping", true);      // json/debug.json
        log.info("info worth keeping", true);        // json/info.json

        // Per-call CSV.
        log.warning("saved as CSV", true, tally::FileFormat::Csv);  // csv/warning.csv
        log.error("CSV error record", false, tally::FileFormat::Csv);  // csv/error.csv

        // Custom root.
        tally::LogManager custom("data/tmp/logs");
        custom.info("info in the custom root");                     // console only
        custom.info("info in the custom root, saved", true);        // data/tmp/logs/json/info.json

        // CSV as the default format.
        tally::LogManager csvLog(tally::defaultLogDirectory(), tally::FileFormat::Csv);
        csvLog.error("error with CSV default");                     // csv/error.csv
        csvLog.error("error forced to JSON", false, tally::FileFormat::Json);  // json/error.json

        // Non-blocking calls run on the manager's dispatch thread; the
        // future is the completion handle.
        std::vector<std::future<void> > pending;
        pending.push_back(log.infoAsync("async info"));
        pending.push_back(log.errorAsync("async error"));
        pending.push_back(log.debugAsync("async debug, saved as CSV", true, tally::FileFormat::Csv));
        for (auto &f : pending) {
            f.get();
        }

        // Builder form.
        auto billing = tally::LogManager::configure()
            .directory("data/tmp/billing")
            .defaultFormat("csv")
            .loggerName("billing")
            .writeConsoleTo<tally::ColorConsoleSink>(tally::ConsoleStream::StdErr)
            .build();
        billing->critical("invoice run aborted");
    } catch (const tally::ConfigurationError &e) {
        std::cerr << "logger setup failed: " << e.what() << std::endl;
        return 1;
    } catch (const tally::TallyLogError &e) {
        std::cerr << "log write failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Check data/logs and data/tmp for the written files." << std::endl;
    return 0;
}
