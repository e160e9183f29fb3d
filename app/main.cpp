#include <filesystem>

#include "app/ViewerApp.hpp"

int main(int argc, char** argv)
{
    const std::filesystem::path configPath = argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path("config") / "viewer.json";

    vista::app::ViewerApp app;
    return app.Run(configPath) ? 0 : 1;
}
