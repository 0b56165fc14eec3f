#include "testvideo.h"
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QTemporaryDir>
#include <gtest/gtest.h>

// Runs the motionmask executable and checks its process exit codes
class CommandLineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_tempDir.isValid());
        m_source = QDir(m_tempDir.path()).absoluteFilePath("clips");
        ASSERT_TRUE(QDir().mkpath(m_source));
    }

    QString sourceFile(const QString& name) const { return QDir(m_source).absoluteFilePath(name); }

    int runMotionMask(const QStringList& arguments)
    {
        QProcess process;
        process.setProgram(MOTIONMASK_PATH);
        process.setArguments(arguments);
        process.setProcessChannelMode(QProcess::ForwardedErrorChannel);
        process.start();
        EXPECT_TRUE(process.waitForStarted(10000)) << process.errorString().toStdString();
        EXPECT_TRUE(process.waitForFinished(120000)) << process.errorString().toStdString();
        EXPECT_EQ(process.exitStatus(), QProcess::NormalExit);
        return process.exitCode();
    }

    QTemporaryDir m_tempDir;
    QString m_source;
};

TEST_F(CommandLineTest, CompletedBatchExitsZeroDespiteFailedVideo)
{
    ASSERT_TRUE(TestVideo::writeGarbage(sourceFile("corrupt.mp4")));
    const QString report = QDir(m_tempDir.path()).absoluteFilePath("report.json");

    EXPECT_EQ(runMotionMask({"--path", m_source, "--dest-dir", "out", "--max-workers", "1",
                             "--report", report}), 0);

    EXPECT_TRUE(QFileInfo::exists(sourceFile("out/corrupt.mp4")));
    EXPECT_TRUE(QFileInfo::exists(report));
}

TEST_F(CommandLineTest, EmptyDirectoryExitsZero)
{
    EXPECT_EQ(runMotionMask({"--path", m_source}), 0);
    EXPECT_TRUE(QFileInfo(sourceFile("unsubtracted_videos")).isDir());
}

TEST_F(CommandLineTest, ConfigurationErrorsExitOne)
{
    ASSERT_TRUE(TestVideo::touch(sourceFile("a.mp4")));

    EXPECT_EQ(runMotionMask({"--path", m_source, "--max-workers", "0"}), 1);
    EXPECT_EQ(runMotionMask({"--path", m_source, "--subtractor", "GMG"}), 1);
    EXPECT_EQ(runMotionMask({"--path", sourceFile("missing")}), 1);

    ASSERT_TRUE(QDir().mkpath(sourceFile("out")));
    ASSERT_TRUE(QDir().mkpath(sourceFile("out_old")));
    EXPECT_EQ(runMotionMask({"--path", m_source, "--dest-dir", "out"}), 1);

    EXPECT_TRUE(QFileInfo::exists(sourceFile("a.mp4")));
}

TEST_F(CommandLineTest, RelocationErrorExitsTwo)
{
    ASSERT_TRUE(TestVideo::touch(sourceFile("a.mp4")));
    ASSERT_TRUE(TestVideo::touch(sourceFile("blocker")));

    EXPECT_EQ(runMotionMask({"--path", m_source, "--dest-dir", "blocker/out"}), 2);
    EXPECT_TRUE(QFileInfo::exists(sourceFile("a.mp4")));
}

TEST_F(CommandLineTest, IncompleteWorkerInvocationExitsThree)
{
    EXPECT_EQ(runMotionMask({"--worker", "--output", sourceFile("a.mp4")}), 3);
    EXPECT_EQ(runMotionMask({"--worker", "--input", sourceFile("a.mp4")}), 3);
}
