#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QTemporaryDir>
#include <memory>

#include "keeper/data/DataError.hpp"
#include "keeper/data/JsonTodoStore.hpp"

using namespace keeper::data;

namespace {
// Aborts the final rename as if the process had died mid-write.
class InterruptedJsonTodoStore : public JsonTodoStore
{
public:
    using JsonTodoStore::JsonTodoStore;

protected:
    bool commitSaveFile(QSaveFile &file) override
    {
        file.cancelWriting();
        return file.commit();
    }
};

Category makeCategory(const QString &id, const QString &name, int todoCount)
{
    Category category;
    category.id = id;
    category.name = name;
    category.color = QStringLiteral("#3498db");
    category.todoCount = todoCount;
    return category;
}

TodoItem makeTodo(const QString &id, const QString &title, const QString &categoryId)
{
    TodoItem todo;
    todo.id = id;
    todo.title = title;
    todo.categoryId = categoryId;
    todo.createdAt = QDateTime(QDate(2024, 3, 10), QTime(9, 15, 30, 250), Qt::UTC);
    return todo;
}

QByteArray readAll(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

bool writeAll(const QString &path, const QByteArray &payload)
{
    QFile file(path);
    return file.open(QIODevice::WriteOnly | QIODevice::Truncate) && file.write(payload) == payload.size();
}
} // namespace

class JsonTodoStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void roundTripPreservesRecords();
    void missingFileLoadsEmpty();
    void blankFileLoadsEmpty();
    void interruptedWriteKeepsPreviousContent();
    void invalidDataIsNotWritten();
    void backupsAreRotated();
    void backupSkippedWithoutDataFile();
    void backupFailureDoesNotBlockSave();
    void corruptFileRecoversFromBackup();
    void corruptFileWithoutBackupsFails();
    void siblingDataFilesKeepSeparateBackups();
    void corruptFileWithoutBackupPathFails();
    void corruptFileWithoutAutoBackupFails();
    void danglingReferenceIsReportedNotRejected();
    void unknownVersionIsLoaded();
    void statsDescribeFiles();
    void exportWritesSummary();
    void exportFailureIsReported();

private:
    StoreConfig config() const;
    QString dataPath() const;
    QString backupPath() const;

    std::unique_ptr<QTemporaryDir> m_dir;
};

void JsonTodoStoreTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void JsonTodoStoreTest::cleanup()
{
    m_dir.reset();
}

StoreConfig JsonTodoStoreTest::config() const
{
    StoreConfig config;
    config.dataPath = dataPath();
    config.backupPath = backupPath();
    return config;
}

QString JsonTodoStoreTest::dataPath() const
{
    return m_dir->filePath(QStringLiteral("data/todos.json"));
}

QString JsonTodoStoreTest::backupPath() const
{
    return m_dir->filePath(QStringLiteral("backups"));
}

void JsonTodoStoreTest::roundTripPreservesRecords()
{
    JsonTodoStore store(config());

    std::vector<Category> categories{ makeCategory(QStringLiteral("c-1"), QStringLiteral("Home"), 2),
                                      makeCategory(QStringLiteral("c-2"), QStringLiteral("Errands"), 1) };

    TodoItem low = makeTodo(QStringLiteral("t-1"), QStringLiteral("Water plants"), QStringLiteral("c-1"));
    low.priority = Priority::Low;

    TodoItem medium = makeTodo(QStringLiteral("t-2"), QStringLiteral("Pay rent"), QStringLiteral("c-1"));
    medium.description = QStringLiteral("Before the 5th");
    medium.dueDate = QDateTime(QDate(2024, 4, 5), QTime(17, 0), Qt::UTC);

    TodoItem high = makeTodo(QStringLiteral("t-3"), QStringLiteral("Post parcel"), QStringLiteral("c-2"));
    high.priority = Priority::High;
    high.completed = true;
    high.completedAt = QDateTime(QDate(2024, 3, 11), QTime(12, 0, 0, 1), Qt::UTC);

    const std::vector<TodoItem> todos{ low, medium, high };
    store.save(todos, categories);

    const StoreData loaded = store.load();
    QVERIFY(loaded.todos == todos);
    QVERIFY(loaded.categories == categories);
    QCOMPARE(loaded.todos.at(2).completedAt->time().msec(), 1);
    QVERIFY(!loaded.todos.at(0).dueDate.has_value());
}

void JsonTodoStoreTest::missingFileLoadsEmpty()
{
    JsonTodoStore store(config());
    const StoreData loaded = store.load();
    QVERIFY(loaded.todos.empty());
    QVERIFY(loaded.categories.empty());
    QVERIFY(!QFile::exists(dataPath()));
}

void JsonTodoStoreTest::blankFileLoadsEmpty()
{
    JsonTodoStore store(config());
    QVERIFY(writeAll(dataPath(), QByteArrayLiteral("  \n\t ")));

    const StoreData loaded = store.load();
    QVERIFY(loaded.todos.empty());
    QVERIFY(loaded.categories.empty());
}

void JsonTodoStoreTest::interruptedWriteKeepsPreviousContent()
{
    StoreConfig cfg = config();
    cfg.backupPath.clear();

    JsonTodoStore store(cfg);
    store.save({ makeTodo(QStringLiteral("t-1"), QStringLiteral("Original"), QStringLiteral("c-1")) },
               { makeCategory(QStringLiteral("c-1"), QStringLiteral("Home"), 1) });
    const QByteArray before = readAll(dataPath());
    const QStringList entriesBefore = QDir(QFileInfo(dataPath()).absolutePath()).entryList(QDir::Files);

    InterruptedJsonTodoStore interrupted(cfg);
    try {
        interrupted.save({}, {});
        QFAIL("interrupted save did not throw");
    } catch (const DataError &error) {
        QCOMPARE(error.code(), ErrorCode::Save);
        QCOMPARE(error.details().value(QStringLiteral("path")).toString(), dataPath());
    }

    QCOMPARE(readAll(dataPath()), before);
    QCOMPARE(QDir(QFileInfo(dataPath()).absolutePath()).entryList(QDir::Files), entriesBefore);
    QCOMPARE(store.load().todos.front().title, QStringLiteral("Original"));
}

void JsonTodoStoreTest::invalidDataIsNotWritten()
{
    JsonTodoStore store(config());
    store.save({}, { makeCategory(QStringLiteral("c-1"), QStringLiteral("Home"), 0) });
    const QByteArray before = readAll(dataPath());

    TodoItem broken = makeTodo(QStringLiteral("t-1"), QStringLiteral("No timestamp"), QStringLiteral("c-1"));
    broken.createdAt = QDateTime();

    QVERIFY_EXCEPTION_THROWN(store.save({ broken }, {}), DataError);
    QCOMPARE(readAll(dataPath()), before);
}

void JsonTodoStoreTest::backupsAreRotated()
{
    StoreConfig cfg = config();
    cfg.maxBackups = 3;
    JsonTodoStore store(cfg);

    store.save({}, {});
    QVERIFY(store.backupFiles().isEmpty());

    QStringList created;
    for (int i = 0; i < 4; ++i) {
        const QString path = store.backup();
        QVERIFY(!path.isEmpty());
        created << QFileInfo(path).fileName();
    }

    const QStringList remaining = store.backupFiles();
    QCOMPARE(remaining.size(), 3);
    QCOMPARE(remaining, created.mid(1));
    for (const QString &name : remaining) {
        QVERIFY(name.startsWith(QStringLiteral("todos-backup-")));
        QVERIFY(name.endsWith(QStringLiteral(".json")));
    }
}

void JsonTodoStoreTest::backupSkippedWithoutDataFile()
{
    JsonTodoStore store(config());
    QVERIFY(store.backup().isEmpty());

    StoreConfig cfg = config();
    cfg.backupPath.clear();
    JsonTodoStore noBackups(cfg);
    noBackups.save({}, {});
    QVERIFY(noBackups.backup().isEmpty());
}

void JsonTodoStoreTest::backupFailureDoesNotBlockSave()
{
    const QString blocker = m_dir->filePath(QStringLiteral("not-a-directory"));
    QVERIFY(writeAll(blocker, QByteArrayLiteral("x")));

    StoreConfig cfg = config();
    cfg.backupPath = blocker;
    JsonTodoStore store(cfg);

    store.save({}, { makeCategory(QStringLiteral("c-1"), QStringLiteral("Home"), 0) });
    store.save({}, { makeCategory(QStringLiteral("c-2"), QStringLiteral("Work"), 0) });

    const StoreData loaded = store.load();
    QCOMPARE(loaded.categories.size(), static_cast<size_t>(1));
    QCOMPARE(loaded.categories.front().name, QStringLiteral("Work"));
}

void JsonTodoStoreTest::corruptFileRecoversFromBackup()
{
    JsonTodoStore store(config());
    store.save({ makeTodo(QStringLiteral("t-1"), QStringLiteral("Saved"), QStringLiteral("c-1")) },
               { makeCategory(QStringLiteral("c-1"), QStringLiteral("Home"), 1) });
    QVERIFY(!store.backup().isEmpty());

    QVERIFY(writeAll(dataPath(), QByteArrayLiteral("{\"todos\": 5, \"categories\": []}")));

    const StoreData loaded = store.load();
    QCOMPARE(loaded.todos.size(), static_cast<size_t>(1));
    QCOMPARE(loaded.todos.front().title, QStringLiteral("Saved"));
}

void JsonTodoStoreTest::corruptFileWithoutBackupsFails()
{
    JsonTodoStore store(config());
    QVERIFY(writeAll(dataPath(), QByteArrayLiteral("{ not json")));

    try {
        store.load();
        QFAIL("load did not throw");
    } catch (const DataError &error) {
        QCOMPARE(error.code(), ErrorCode::Load);
        QCOMPARE(error.details().value(QStringLiteral("recovery")).toString(), QStringLiteral("NO_BACKUPS"));
        QVERIFY(error.details().value(QStringLiteral("cause")).toString().startsWith(QStringLiteral("Malformed JSON")));
    }
}

void JsonTodoStoreTest::siblingDataFilesKeepSeparateBackups()
{
    StoreConfig first;
    first.dataPath = m_dir->filePath(QStringLiteral("first.json"));
    first.backupPath = StoreConfig::backupPathFor(first.dataPath);
    StoreConfig second;
    second.dataPath = m_dir->filePath(QStringLiteral("second.json"));
    second.backupPath = StoreConfig::backupPathFor(second.dataPath);
    QVERIFY(first.backupPath != second.backupPath);

    JsonTodoStore firstStore(first);
    firstStore.save({}, { makeCategory(QStringLiteral("c-1"), QStringLiteral("First"), 0) });
    QVERIFY(!firstStore.backup().isEmpty());

    JsonTodoStore secondStore(second);
    QVERIFY(writeAll(second.dataPath, QByteArrayLiteral("{")));
    QCOMPARE(secondStore.stats().backupCount, 0);

    try {
        secondStore.load();
        QFAIL("load recovered from another file's backup");
    } catch (const DataError &error) {
        QCOMPARE(error.code(), ErrorCode::Load);
        QCOMPARE(error.details().value(QStringLiteral("recovery")).toString(), QStringLiteral("NO_BACKUPS"));
    }
    QCOMPARE(firstStore.stats().backupCount, 1);
}

void JsonTodoStoreTest::corruptFileWithoutBackupPathFails()
{
    StoreConfig cfg = config();
    cfg.backupPath.clear();
    JsonTodoStore store(cfg);
    QVERIFY(writeAll(dataPath(), QByteArrayLiteral("[]")));

    try {
        store.load();
        QFAIL("load did not throw");
    } catch (const DataError &error) {
        QCOMPARE(error.code(), ErrorCode::Load);
        QCOMPARE(error.details().value(QStringLiteral("recovery")).toString(), QStringLiteral("NO_BACKUP_PATH"));
    }
}

void JsonTodoStoreTest::corruptFileWithoutAutoBackupFails()
{
    StoreConfig cfg = config();
    cfg.autoBackup = false;
    JsonTodoStore store(cfg);
    QVERIFY(writeAll(dataPath(), QByteArrayLiteral("{\"todos\": [], \"categories\": {}}")));

    try {
        store.load();
        QFAIL("load did not throw");
    } catch (const DataError &error) {
        QCOMPARE(error.code(), ErrorCode::Load);
        QVERIFY(!error.details().contains(QStringLiteral("recovery")));
    }
}

void JsonTodoStoreTest::danglingReferenceIsReportedNotRejected()
{
    JsonTodoStore store(config());
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("references non-existent category: c-gone")));
    store.save({ makeTodo(QStringLiteral("t-1"), QStringLiteral("Orphan"), QStringLiteral("c-gone")) }, {});

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("\"Orphan\" references non-existent category")));
    const StoreData loaded = store.load();
    QCOMPARE(loaded.todos.size(), static_cast<size_t>(1));
    QCOMPARE(loaded.todos.front().categoryId, QStringLiteral("c-gone"));
}

void JsonTodoStoreTest::unknownVersionIsLoaded()
{
    JsonTodoStore store(config());
    store.save({}, { makeCategory(QStringLiteral("c-1"), QStringLiteral("Home"), 0) });

    QJsonObject object = QJsonDocument::fromJson(readAll(dataPath())).object();
    QCOMPARE(object.value(QStringLiteral("version")).toString(), QStringLiteral("1.0.0"));
    object.insert(QStringLiteral("version"), QStringLiteral("0.9.0"));
    QVERIFY(writeAll(dataPath(), QJsonDocument(object).toJson()));

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Unknown data version")));
    QCOMPARE(store.load().categories.size(), static_cast<size_t>(1));
}

void JsonTodoStoreTest::statsDescribeFiles()
{
    JsonTodoStore store(config());

    StoreStats stats = store.stats();
    QVERIFY(!stats.exists);
    QCOMPARE(stats.size, qint64(0));
    QCOMPARE(stats.backupCount, 0);

    store.save({}, {});
    QVERIFY(!store.backup().isEmpty());

    stats = store.stats();
    QVERIFY(stats.exists);
    QCOMPARE(stats.size, QFileInfo(dataPath()).size());
    QVERIFY(stats.lastModified.isValid());
    QCOMPARE(stats.backupCount, 1);
}

void JsonTodoStoreTest::exportWritesSummary()
{
    JsonTodoStore store(config());
    TodoItem done = makeTodo(QStringLiteral("t-1"), QStringLiteral("Done"), QStringLiteral("c-1"));
    done.completed = true;
    done.completedAt = QDateTime::currentDateTimeUtc();
    store.save({ done, makeTodo(QStringLiteral("t-2"), QStringLiteral("Open"), QStringLiteral("c-1")) },
               { makeCategory(QStringLiteral("c-1"), QStringLiteral("Home"), 2) });

    const QString target = m_dir->filePath(QStringLiteral("exports/today.json"));
    store.exportTo(target);

    const QJsonObject exported = QJsonDocument::fromJson(readAll(target)).object();
    const QJsonObject summary = exported.value(QStringLiteral("summary")).toObject();
    QCOMPARE(summary.value(QStringLiteral("totalTodos")).toInt(), 2);
    QCOMPARE(summary.value(QStringLiteral("completedTodos")).toInt(), 1);
    QCOMPARE(summary.value(QStringLiteral("totalCategories")).toInt(), 1);
    QVERIFY(exported.value(QStringLiteral("exportDate")).isObject());
}

void JsonTodoStoreTest::exportFailureIsReported()
{
    JsonTodoStore store(config());
    store.save({}, {});

    try {
        store.exportTo(dataPath() + QStringLiteral("/nested/export.json"));
        QFAIL("export did not throw");
    } catch (const DataError &error) {
        QCOMPARE(error.code(), ErrorCode::Export);
    }
}

QTEST_GUILESS_MAIN(JsonTodoStoreTest)
#include "JsonTodoStoreTest.moc"
