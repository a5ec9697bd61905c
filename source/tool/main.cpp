#include <std_include.hpp>

#include "tool_startup.hpp"
#include "debugging/toollog.hpp"
#include "manip/arguments.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
    google::InitGoogleLogging(argv[0]);
    // glog keeps ERROR lines in its own files, the console belongs to the logger
    FLAGS_stderrthreshold = google::GLOG_FATAL;

    int result = 0;
    try
    {
        result = tool::run(argc, argv);
    }
    catch (const string_manip::argument_error& ex)
    {
        std::cerr << "CMake Error: " << ex.what() << std::endl;
        logger::write(logger::LOG_LEVEL_ERROR, logger::LOG_LABEL_ARGUMENTS, "%s", ex.what());
        result = 1;
    }
    catch (const std::exception& ex)
    {
        logger::write(logger::LOG_LEVEL_CRITICAL, logger::LOG_LABEL_INITIALIZER, "Unhandled exception: %s", ex.what());
        result = 2;
    }

    google::ShutdownGoogleLogging();
    return result;
}
