/*
 * sandterm C++ - Sandboxed terminal execution service
 *
 * Usage:
 *   ./sandterm [--config config.json]
 *
 * All configuration is read from the config file.
 */
#include <sandterm/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = sandterm::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        if (!app.is_running()) return 0;
        app.shutdown();
        return 1;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
