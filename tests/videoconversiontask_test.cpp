#include "conversionjob.h"
#include "testvideo.h"
#include "videoconversiontask.h"
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QList>
#include <QTemporaryDir>
#include <gtest/gtest.h>

class VideoConversionTaskTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_tempDir.isValid());
        ASSERT_TRUE(QDir().mkpath(path("backup")));
    }

    QString path(const QString& name) const { return QDir(m_tempDir.path()).absoluteFilePath(name); }

    // The converter reads from the backup copy and writes to the original location
    ConversionJob makeJob(const QString& name) const
    {
        ConversionJob job;
        job.video = VideoFile(path(name), path("backup/" + name));
        job.fourcc = "MJPG";
        return job;
    }

    QTemporaryDir m_tempDir;
};

TEST_F(VideoConversionTaskTest, ConvertsEveryFrame)
{
    ConversionJob job = makeJob("a.avi");
    ASSERT_TRUE(TestVideo::write(job.video.backupPath, 30));

    VideoConversionTask task(job);
    const JobResult result = task.run();

    ASSERT_TRUE(result.succeeded()) << result.errorKind.toStdString() << ": " << result.errorMessage.toStdString();
    EXPECT_EQ(result.framesProcessed, 30);
    EXPECT_EQ(result.inputPath, job.video.backupPath);
    EXPECT_EQ(result.outputPath, job.video.outputPath);
    EXPECT_EQ(task.state(), VideoConversionTask::State::Done);

    EXPECT_EQ(TestVideo::countFrames(job.video.outputPath), 30);
    // The original stays untouched in the backup directory
    EXPECT_EQ(TestVideo::countFrames(job.video.backupPath), 30);
}

TEST_F(VideoConversionTaskTest, ConvertsWithKnn)
{
    ConversionJob job = makeJob("b.avi");
    job.subtractor = SubtractorKind::KNN;
    ASSERT_TRUE(TestVideo::write(job.video.backupPath, 12));

    const JobResult result = VideoConversionTask(job).run();

    ASSERT_TRUE(result.succeeded()) << result.errorMessage.toStdString();
    EXPECT_EQ(result.framesProcessed, 12);
    EXPECT_EQ(TestVideo::countFrames(job.video.outputPath), 12);
}

TEST_F(VideoConversionTaskTest, EmitsStatesAndProgress)
{
    ConversionJob job = makeJob("a.avi");
    job.progressInterval = 5;
    ASSERT_TRUE(TestVideo::write(job.video.backupPath, 12));

    VideoConversionTask task(job);
    QList<VideoConversionTask::State> states;
    QList<qint64> progress;
    int finished = 0;
    QObject::connect(&task, &VideoConversionTask::stateChanged,
                     [&states](VideoConversionTask::State state) { states.append(state); });
    QObject::connect(&task, &VideoConversionTask::progress,
                     [&progress](qint64 frames, double) { progress.append(frames); });
    QObject::connect(&task, &VideoConversionTask::conversionFinished,
                     [&finished](const JobResult&) { ++finished; });

    ASSERT_TRUE(task.run().succeeded());

    EXPECT_EQ(progress, QList<qint64>({5, 10}));
    EXPECT_EQ(finished, 1);
    ASSERT_EQ(states.size(), 3);
    EXPECT_EQ(states[0], VideoConversionTask::State::Streaming);
    EXPECT_EQ(states[1], VideoConversionTask::State::Closing);
    EXPECT_EQ(states[2], VideoConversionTask::State::Done);
}

TEST_F(VideoConversionTaskTest, MissingInputIsOpenError)
{
    ConversionJob job = makeJob("missing.avi");

    VideoConversionTask task(job);
    QString errorStage;
    QObject::connect(&task, &VideoConversionTask::conversionError,
                     [&errorStage](const QString& stage, qint64, const QString&) { errorStage = stage; });

    const JobResult result = task.run();

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.errorKind, "IOOpenError");
    EXPECT_EQ(result.frameIndex, -1);
    EXPECT_EQ(result.framesProcessed, 0);
    EXPECT_EQ(errorStage, "OPENING");
    EXPECT_EQ(task.state(), VideoConversionTask::State::Failed);
    EXPECT_FALSE(QFileInfo::exists(job.video.outputPath));
}

TEST_F(VideoConversionTaskTest, CorruptInputIsOpenError)
{
    ConversionJob job = makeJob("corrupt.mp4");
    ASSERT_TRUE(TestVideo::writeGarbage(job.video.backupPath));

    const JobResult result = VideoConversionTask(job).run();

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.errorKind, "IOOpenError");
    EXPECT_FALSE(result.errorMessage.isEmpty());
}

TEST_F(VideoConversionTaskTest, UnwritableOutputIsOpenError)
{
    ConversionJob job = makeJob("a.avi");
    ASSERT_TRUE(TestVideo::write(job.video.backupPath, 5));
    job.video.outputPath = path("no/such/directory/a.avi");

    const JobResult result = VideoConversionTask(job).run();

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.errorKind, "IOOpenError");
}

TEST_F(VideoConversionTaskTest, RefusesToOverwriteInput)
{
    ConversionJob job = makeJob("a.avi");
    ASSERT_TRUE(TestVideo::write(job.video.backupPath, 5));
    job.video.outputPath = job.video.backupPath;

    const JobResult result = VideoConversionTask(job).run();

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.errorKind, "IOOpenError");
    EXPECT_EQ(TestVideo::countFrames(job.video.backupPath), 5);
}

TEST_F(VideoConversionTaskTest, ArgumentsRoundTripThroughWorkerOptions)
{
    ConversionJob job = makeJob("a.avi");
    job.subtractor = SubtractorKind::KNN;
    job.params.history = 200;
    job.params.threshold = 300.5;
    job.params.detectShadows = false;
    job.progressInterval = 50;

    QCommandLineParser parser;
    parser.addOption(QCommandLineOption("subtractor", "", "name"));
    ConversionJob::addWorkerOptions(parser);
    ASSERT_TRUE(parser.parse(QStringList("motionmask") + job.toArguments()));

    const ConversionJob parsed = ConversionJob::fromCommandLine(parser);
    EXPECT_EQ(parsed.video.backupPath, job.video.backupPath);
    EXPECT_EQ(parsed.video.outputPath, job.video.outputPath);
    EXPECT_EQ(parsed.subtractor, SubtractorKind::KNN);
    EXPECT_EQ(parsed.params.history, 200);
    EXPECT_DOUBLE_EQ(parsed.params.threshold, 300.5);
    EXPECT_FALSE(parsed.params.detectShadows);
    EXPECT_EQ(parsed.fourcc, "MJPG");
    EXPECT_EQ(parsed.progressInterval, 50);
}

TEST_F(VideoConversionTaskTest, FrameSizeChangeFailsAtThatFrame)
{
    const QList<cv::Size> sizes = {cv::Size(160, 120), cv::Size(160, 120), cv::Size(160, 120),
                                   cv::Size(160, 120), cv::Size(160, 120),
                                   cv::Size(80, 60), cv::Size(80, 60)};
    const QString sequence = TestVideo::writeImageSequence(path("sequence"), sizes);
    ASSERT_FALSE(sequence.isEmpty());

    ConversionJob job;
    job.video = VideoFile(path("a.avi"), sequence);
    job.fourcc = "MJPG";

    VideoConversionTask task(job);
    QList<VideoConversionTask::State> states;
    QString errorStage;
    qint64 errorFrame = -1;
    QObject::connect(&task, &VideoConversionTask::stateChanged,
                     [&states](VideoConversionTask::State state) { states.append(state); });
    QObject::connect(&task, &VideoConversionTask::conversionError,
                     [&errorStage, &errorFrame](const QString& stage, qint64 frameIndex, const QString&) {
                         errorStage = stage;
                         errorFrame = frameIndex;
                     });

    const JobResult result = task.run();

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.errorKind, "FrameProcessingError");
    EXPECT_EQ(result.frameIndex, 5);
    EXPECT_EQ(result.framesProcessed, 5);
    EXPECT_TRUE(result.errorMessage.contains("FrameFormatError")) << result.errorMessage.toStdString();
    EXPECT_EQ(errorStage, "STREAMING");
    EXPECT_EQ(errorFrame, 5);

    ASSERT_EQ(states.size(), 3);
    EXPECT_EQ(states[0], VideoConversionTask::State::Streaming);
    EXPECT_EQ(states[1], VideoConversionTask::State::Closing);
    EXPECT_EQ(states[2], VideoConversionTask::State::Failed);

    // The encoder was released: the partial output is a complete, readable file
    EXPECT_EQ(TestVideo::countFrames(job.video.outputPath), 5);
}
