#include <QtTest/QtTest>

#include "todotxt/core/TaskParser.hpp"
#include "todotxt/core/TaskSerializer.hpp"

using namespace todotxt::core;

namespace {

Task makeTask(bool complete, std::optional<QChar> priority, const QString &description,
              const QStringList &projects, const QStringList &contexts,
              const QVector<TaskAttribute> &attributes)
{
    Task task;
    task.isComplete = complete;
    task.priority = priority;
    task.description = description;
    task.projects = projects;
    task.contexts = contexts;
    task.attributes = attributes;
    return task;
}

} // namespace

class TaskSerializerTest : public QObject
{
    Q_OBJECT

private slots:
    void completeTaskInCanonicalOrder();
    void emptyTask();
    void descriptionOnly();
    void emptyDescriptionLeavesDoubleSpace();
    void markersAlone();
    void trailingWhitespaceIsTrimmed();
    void editAfterParse();
    void tokensAreReordered();
    void constructedTasksRoundTrip();
    void parsedLinesReparseEqual();
};

void TaskSerializerTest::completeTaskInCanonicalOrder()
{
    const Task task = makeTask(true, QChar(QLatin1Char('C')), QStringLiteral("Take out the trash"), {},
                               { QStringLiteral("home") },
                               { TaskAttribute{ QStringLiteral("day"), QStringLiteral("wednesdays") } });

    QCOMPARE(serializeTask(task), QStringLiteral("x (C) Take out the trash @home day:wednesdays"));
}

void TaskSerializerTest::emptyTask()
{
    QCOMPARE(serializeTask(Task{}), QString());
}

void TaskSerializerTest::descriptionOnly()
{
    Task task;
    task.description = QStringLiteral("Just text");
    QCOMPARE(serializeTask(task), QStringLiteral("Just text"));
}

void TaskSerializerTest::emptyDescriptionLeavesDoubleSpace()
{
    Task task;
    task.isComplete = true;
    task.projects << QStringLiteral("garden");
    QCOMPARE(serializeTask(task), QStringLiteral("x  +garden"));

    Task contextOnly;
    contextOnly.contexts << QStringLiteral("phone");
    QCOMPARE(serializeTask(contextOnly), QStringLiteral(" @phone"));
}

void TaskSerializerTest::markersAlone()
{
    Task task;
    task.isComplete = true;
    QCOMPARE(serializeTask(task), QStringLiteral("x"));

    task.priority = QLatin1Char('A');
    QCOMPARE(serializeTask(task), QStringLiteral("x (A)"));
}

void TaskSerializerTest::trailingWhitespaceIsTrimmed()
{
    Task task;
    task.description = QStringLiteral("  padded  ");
    QCOMPARE(serializeTask(task), QStringLiteral("  padded"));
}

void TaskSerializerTest::editAfterParse()
{
    Task task = parseTask(QStringLiteral("Document this library"));
    task.projects << QStringLiteral("cpp");
    task.isComplete = true;

    QCOMPARE(serializeTask(task), QStringLiteral("x Document this library +cpp"));
}

void TaskSerializerTest::tokensAreReordered()
{
    const Task task = parseTask(QStringLiteral("@home due:sat Clean +house (A) now"));

    QCOMPARE(serializeTask(task), QStringLiteral("Clean  (A) now +house @home due:sat"));
}

void TaskSerializerTest::constructedTasksRoundTrip()
{
    const QVector<Task> tasks = {
        Task{},
        makeTask(false, std::nullopt, QStringLiteral("Plain"), {}, {}, {}),
        makeTask(true, QChar(QLatin1Char('C')), QStringLiteral("Take out the trash"), {},
                 { QStringLiteral("home") },
                 { TaskAttribute{ QStringLiteral("day"), QStringLiteral("wednesdays") } }),
        makeTask(false, QChar(QLatin1Char('Z')), QStringLiteral("Many  spaces inside"),
                 { QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("a") },
                 { QStringLiteral("c_1") },
                 { TaskAttribute{ QStringLiteral("k"), QStringLiteral("1") },
                   TaskAttribute{ QStringLiteral("k"), QStringLiteral("2") } }),
        makeTask(true, std::nullopt, QString(), { QStringLiteral("solo") }, {}, {}),
        makeTask(false, std::nullopt, QString(), {}, {},
                 { TaskAttribute{ QStringLiteral("due"), QStringLiteral("2024") } }),
        makeTask(true, std::nullopt, QStringLiteral("x marks the spot"), {}, {}, {}),
        makeTask(false, QChar(QLatin1Char('B')), QStringLiteral("(A) looks like priority"), {}, {}, {}),
    };

    for (const Task &task : tasks) {
        const QString line = serializeTask(task);
        QVERIFY2(parseTask(line) == task, qPrintable(line));
    }
}

void TaskSerializerTest::parsedLinesReparseEqual()
{
    const QStringList lines = {
        QStringLiteral("(B) Write some code +rust @work due:tomorrow"),
        QStringLiteral("x Buy eggs @shopping @home"),
        QStringLiteral("@home due:sat Clean +house"),
        QStringLiteral("Call +family mom @phone  today"),
        QStringLiteral("x (A) a+x:b trailing"),
        QStringLiteral("(AB) not a priority"),
        QStringLiteral("Text x done"),
        QStringLiteral("x"),
        QStringLiteral(" @only"),
        QString(),
    };

    for (const QString &line : lines) {
        const Task first = parseTask(line);
        const QString canonical = serializeTask(first);
        QVERIFY2(parseTask(canonical) == first, qPrintable(line));
        QCOMPARE(serializeTask(parseTask(canonical)), canonical);
    }
}

QTEST_GUILESS_MAIN(TaskSerializerTest)
#include "TaskSerializerTest.moc"
