#include "app/ChatVaultApp.hpp"

int main(int argc, char** argv) {
    chatvault::app::ChatVaultApp app;
    return app.Run(argc, argv);
}
