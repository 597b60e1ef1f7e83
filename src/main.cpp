#include "ReportingApp.hpp"
#include "domain/exceptions/RepositoryUnavailableException.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        // Template Method:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        ReportingApp app;
        return app.run(argc, argv);
    }
    catch (const reporting::domain::RepositoryUnavailableException& e)
    {
        std::cerr << "[main] Report generation failed: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
