#include "app/game_app.h"

#include <filesystem>

int main(int argc, char* argv[]) {
    std::filesystem::path config_path = "config/pitchsync.cfg";
    if (argc > 1) {
        config_path = argv[1];
    }

    pitchsync::app::GameApp app;
    if (!app.Initialize(config_path)) {
        return 1;
    }

    const int exit_code = app.Run();
    app.Shutdown();
    return exit_code;
}
