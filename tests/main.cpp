#include <catch2/catch_session.hpp>

#include <QCoreApplication>

int main(int argc, char *argv[]) {
    // Worker threads run event loops, which need an application instance.
    QCoreApplication app(argc, argv);
    return Catch::Session().run(argc, argv);
}
