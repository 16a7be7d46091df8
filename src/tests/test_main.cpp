#include <gtest/gtest.h>

#include <QCoreApplication>

int main(int argc, char* argv[]) {
    // QProcess, QEventLoop and QNetworkAccessManager need an application instance
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
