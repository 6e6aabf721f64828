#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <algorithm>
#include <optional>

#include "version.h"

#include "keeper/core/TodoManager.hpp"
#include "keeper/data/DataError.hpp"
#include "keeper/data/TodoStore.hpp"

using namespace keeper;

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

std::optional<data::Category> categoryByName(const core::TodoManager &manager, const QString &name)
{
    for (const auto &category : manager.allCategories()) {
        if (category.name.compare(name, Qt::CaseInsensitive) == 0) {
            return category;
        }
    }
    return std::nullopt;
}

data::Category requireCategory(const core::TodoManager &manager, const QString &name)
{
    const auto category = categoryByName(manager, name);
    if (!category) {
        throw data::DataError(data::ErrorCode::CategoryNotFound,
                              QStringLiteral("No category named \"%1\"").arg(name),
                              { { QStringLiteral("name"), name } });
    }
    return *category;
}

void printTodo(const data::TodoItem &todo)
{
    out() << (todo.completed ? "[x] " : "[ ] ") << todo.id << "  " << todo.title
          << "  (" << data::priorityToString(todo.priority) << ")";
    if (todo.dueDate) {
        out() << "  due " << todo.dueDate->toLocalTime().toString(Qt::ISODate);
    }
    out() << '\n';
}

int usage(const QCommandLineParser &parser)
{
    err() << parser.helpText();
    return 2;
}

int run(core::TodoManager &manager, const QCommandLineParser &parser)
{
    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0);

    if (command == QLatin1String("list")) {
        auto todos = args.size() > 1 ? manager.todosByCategory(requireCategory(manager, args.at(1)).id)
                                     : manager.allTodos();
        std::stable_sort(todos.begin(), todos.end(), [](const data::TodoItem &lhs, const data::TodoItem &rhs) {
            if (lhs.completed != rhs.completed) {
                return !lhs.completed;
            }
            return data::priorityWeight(lhs.priority) > data::priorityWeight(rhs.priority);
        });
        for (const auto &todo : todos) {
            printTodo(todo);
        }
        return 0;
    }
    if (command == QLatin1String("add") && args.size() > 1) {
        data::TodoInput input;
        input.title = args.at(1);
        if (parser.isSet(QStringLiteral("priority"))) {
            const auto priority = data::priorityFromString(parser.value(QStringLiteral("priority")));
            if (!priority) {
                err() << "Unknown priority " << parser.value(QStringLiteral("priority")) << '\n';
                return 2;
            }
            input.priority = *priority;
        }
        const QString categoryName = parser.isSet(QStringLiteral("category"))
            ? parser.value(QStringLiteral("category"))
            : manager.allCategories().empty() ? QString() : manager.allCategories().front().name;
        input.categoryId = requireCategory(manager, categoryName).id;
        if (parser.isSet(QStringLiteral("due"))) {
            input.dueDate = QDateTime::fromString(parser.value(QStringLiteral("due")), Qt::ISODate);
        }
        printTodo(manager.addTodo(std::move(input)));
        return 0;
    }
    if (command == QLatin1String("done") && args.size() > 1) {
        printTodo(manager.toggleTodoCompletion(args.at(1)));
        return 0;
    }
    if (command == QLatin1String("remove") && args.size() > 1) {
        manager.deleteTodo(args.at(1));
        return 0;
    }
    if (command == QLatin1String("categories")) {
        for (const auto &category : manager.allCategories()) {
            out() << category.name << "  " << category.color << "  " << category.todoCount << '\n';
        }
        return 0;
    }
    if (command == QLatin1String("add-category") && args.size() > 2) {
        manager.addCategory({ args.at(1), args.at(2) });
        return 0;
    }
    if (command == QLatin1String("remove-category") && args.size() > 1) {
        const QString target = parser.isSet(QStringLiteral("move-to"))
            ? requireCategory(manager, parser.value(QStringLiteral("move-to"))).id
            : QString();
        manager.deleteCategory(requireCategory(manager, args.at(1)).id, target);
        return 0;
    }
    if (command == QLatin1String("stats")) {
        core::Statistics stats = manager.statistics();
        const data::StoreStats file = manager.store().stats();
        out() << "Todos:      " << stats.totalTodos << " (" << stats.completedTodos << " completed, "
              << stats.pendingTodos << " pending, " << stats.overdueTodos << " overdue)\n";
        out() << "Priorities: high " << stats.priorityBreakdown[data::Priority::High]
              << ", medium " << stats.priorityBreakdown[data::Priority::Medium]
              << ", low " << stats.priorityBreakdown[data::Priority::Low] << '\n';
        out() << "Categories: " << stats.totalCategories << '\n';
        out() << "Data file:  " << (file.exists ? QString::number(file.size) + QStringLiteral(" bytes") : QStringLiteral("absent"))
              << ", " << file.backupCount << " backups\n";
        return 0;
    }
    if (command == QLatin1String("backup")) {
        const QString path = manager.store().backup();
        out() << (path.isEmpty() ? QStringLiteral("Nothing to back up") : path) << '\n';
        return 0;
    }
    if (command == QLatin1String("export") && args.size() > 1) {
        manager.store().exportTo(args.at(1));
        return 0;
    }
    return usage(parser);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Todo Keeper"));
    QCoreApplication::setApplicationName(QStringLiteral("todo-keeper"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTodoKeeperVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Keeps todos and categories in a JSON file."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        { QStringLiteral("config"), QStringLiteral("Read storage settings from <ini>."), QStringLiteral("ini") },
        { QStringLiteral("data"), QStringLiteral("Use <path> as data file."), QStringLiteral("path") },
        { QStringLiteral("priority"), QStringLiteral("Priority for add: low, medium or high."), QStringLiteral("priority") },
        { QStringLiteral("category"), QStringLiteral("Category name for add."), QStringLiteral("name") },
        { QStringLiteral("due"), QStringLiteral("ISO-8601 due date for add."), QStringLiteral("date") },
        { QStringLiteral("move-to"), QStringLiteral("Category receiving the todos of a removed category."), QStringLiteral("name") },
        { QStringLiteral("verbose"), QStringLiteral("Print storage diagnostics.") },
    });
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("list, add, done, remove, categories, add-category, "
                                                "remove-category, stats, backup or export."));
    parser.process(app);

    if (parser.isSet(QStringLiteral("verbose"))) {
        QLoggingCategory::setFilterRules(QStringLiteral("keeper.*.debug=true"));
    } else {
        QLoggingCategory::setFilterRules(QStringLiteral("keeper.*.info=false"));
    }

    if (parser.positionalArguments().isEmpty()) {
        return usage(parser);
    }

    try {
        const QString dataPath = parser.value(QStringLiteral("data"));
        core::ManagerConfig config;
        if (parser.isSet(QStringLiteral("config"))) {
            const QSettings settings(parser.value(QStringLiteral("config")), QSettings::IniFormat);
            config = core::ManagerConfig::fromSettings(settings, dataPath);
        } else {
            const QSettings settings;
            config = core::ManagerConfig::fromSettings(settings, dataPath);
        }

        core::TodoManager manager(config);
        manager.initialize();
        return run(manager, parser);
    } catch (const data::DataError &error) {
        err() << error.codeName() << ": " << error.message() << '\n';
        return 1;
    }
}
