#include <FlowPost/FlowPost.h>
#include <FlowPost/CLI.h>
#include <FlowPost/Errors.h>

#include <iostream>

using namespace FLOW;

int main(int argc, char* argv[]) {

    // convenience method for parsing arguments; exits with usage on bad input
    CLIArgs args = FLOW::parse_args(argc, const_cast<const char**>(argv));

    FlowPost app;

    int status = 0;
    try {
        // convenience method for the core application loop
        FLOW::run(&app, args);
    } catch (const ConfigError & e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        status = 201;
    } catch (const InitializationError & e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        status = 202;
    } catch (const NumericError & e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        status = 203;
    } catch (const StorageError & e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        status = 212;
    } catch (const std::exception & e) {
        // e.g. std::bad_alloc for a grid that does not fit in memory
        std::cerr << "ERROR: " << e.what() << std::endl;
        status = 220;
    }

    return status;
}
