#include "toolgate/cli/app.hpp"

int main(int argc, char** argv) {
    toolgate::cli::App app;
    return app.run(argc, argv);
}
