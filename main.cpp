#include "app/TidyFileApp.hpp"

int main(int argc, char** argv) {
    tidyfile::app::TidyFileApp app;
    return app.Run(argc, argv);
}
