#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "keeper/data/Category.hpp"
#include "keeper/data/Todo.hpp"

namespace keeper {
namespace data {

constexpr int MaxTitleLength = 200;
constexpr int MaxDescriptionLength = 1000;
constexpr int MaxCategoryNameLength = 50;

struct ValidationResult
{
    bool valid = true;
    QString error;

    static ValidationResult ok() { return {}; }
    static ValidationResult fail(QString message) { return { false, std::move(message) }; }

    explicit operator bool() const { return valid; }
};

// Aggregated result of validating a whole input record.
struct ValidationReport
{
    QStringList errors;

    bool isValid() const { return errors.isEmpty(); }
    void add(const ValidationResult &result);
};

ValidationResult validateTitle(const QString &title);
ValidationResult validateDescription(const QString &description);
ValidationResult validatePriority(Priority priority);
ValidationResult validateCategoryId(const QString &categoryId);
ValidationResult validateDueDate(const std::optional<QDateTime> &dueDate);
ValidationReport validateTodoInput(const TodoInput &input);

ValidationResult validateCategoryName(const QString &name);
ValidationResult validateCategoryColor(const QString &color);
ValidationReport validateCategoryInput(const CategoryInput &input);

bool isReservedCategoryName(const QString &name);
bool isCategoryNameUnique(const QString &name,
                          const std::vector<Category> &candidates,
                          const QString &excludeId = QString());

} // namespace data
} // namespace keeper
