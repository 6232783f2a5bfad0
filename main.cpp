#include "app/CiteWalkerApp.hpp"

int main(int argc, char** argv) {
    citewalker::app::CiteWalkerApp app;
    return app.Run(argc, argv);
}
