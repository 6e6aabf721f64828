#include "keeper/data/Category.hpp"

#include "keeper/data/Todo.hpp"

namespace keeper {
namespace data {

namespace {
constexpr auto FALLBACK_COLOR = "#95a5a6";
} // namespace

bool operator==(const Category &lhs, const Category &rhs)
{
    return lhs.id == rhs.id
        && lhs.name == rhs.name
        && lhs.color == rhs.color
        && lhs.todoCount == rhs.todoCount;
}

bool operator!=(const Category &lhs, const Category &rhs)
{
    return !(lhs == rhs);
}

Category createCategory(CategoryInput input)
{
    Category category;
    category.id = createId();
    category.name = std::move(input.name);
    category.color = normalizeColor(input.color);
    category.todoCount = 0;
    return category;
}

QString normalizeColor(const QString &color)
{
    const QString trimmed = color.trimmed();
    if (trimmed.isEmpty()) {
        return QString::fromLatin1(FALLBACK_COLOR);
    }
    if (trimmed.startsWith('#')) {
        return trimmed;
    }
    return QLatin1Char('#') + trimmed;
}

std::vector<CategoryInput> defaultCategories()
{
    return {
        { QStringLiteral("Personal"), QStringLiteral("#3498db") },
        { QStringLiteral("Work"), QStringLiteral("#2ecc71") },
        { QStringLiteral("Shopping"), QStringLiteral("#f39c12") },
        { QStringLiteral("Health"), QStringLiteral("#e74c3c") },
    };
}

} // namespace data
} // namespace keeper
