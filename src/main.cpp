#include "adhoc/ansi.hpp"
#include "adhoc/app.hpp"

#include <iostream>
#include <utility>

int main(int argc, char **argv)
{
    adhoc::ansi::enable_virtual_terminal_on_windows();

    const std::string program = argc > 0 ? app::executable_path(argv[0]).filename().string() : "adhoc_task";

    app::Options options;
    try
    {
        options = app::parse_options(argc, argv);
    }
    catch (const app::UsageError &e)
    {
        std::cerr << "error: " << e.what() << "\n\n"
                  << app::usage(program);
        return 2;
    }

    if (options.showHelp)
    {
        std::cout << app::usage(program);
        return 0;
    }

    app::Application application(std::move(options));
    return application.run();
}
