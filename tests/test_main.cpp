#include <QCoreApplication>
#include <gtest/gtest.h>

// The process runner delivers completion through queued signals, so the
// tests need an application object and spin its event loop while waiting.
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
