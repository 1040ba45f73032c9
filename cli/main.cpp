// SceneX - Entry Point

#include "cli.h"

int main(int argc, char** argv) {
    return scenex::cli::run(argc, argv);
}
