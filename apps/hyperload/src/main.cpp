#include <hyperload/LoadRunner.hpp>
#include <hyperload/core/ConfigLoader.hpp>
#include <hyperload/core/Errors.hpp>
#include <hyperload/core/Logger.hpp>
#include <hyperload/core/LoggingConfig.hpp>
#include <hyperload/report/ReportPrinter.hpp>

#include <iostream>

int main(int argc, char **argv)
{
    try
    {
        auto cfg = hyperload::core::ConfigLoader::load(argc, argv, std::cout);
        if (!cfg)
            return 0; // --help

        hyperload::core::applyLoggingConfig(*cfg);
        hyperload::report::printBanner(std::cout, *cfg);

        hyperload::LoadRunner runner(*cfg);
        const auto summary = runner.run();

        hyperload::report::printReport(std::cout, *cfg, summary);
        hyperload::core::shutdownLogger();
        return 0;
    }
    catch (const hyperload::core::ConfigurationError &e)
    {
        HLOG_ERROR("Main", "ConfigurationError", "err='{}'", e.what());
        hyperload::core::shutdownLogger();
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Run with --help for usage.\n";
        return 2;
    }
    catch (const std::exception &e)
    {
        HLOG_FATAL("Main", "Fatal", "err='{}'", e.what());
        hyperload::core::shutdownLogger();
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
