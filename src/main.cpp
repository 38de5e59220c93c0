#include "ctxopt/cli/app.hpp"

int main(int argc, char** argv) {
    ctxopt::cli::App app;
    return app.run(argc, argv);
}
