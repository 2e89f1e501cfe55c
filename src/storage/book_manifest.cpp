#include "storage/book_manifest.hpp"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <set>

namespace sheaf::storage {

namespace {

Error invalid(const QString& message) {
    return Error{message.toStdString(), ErrorKind::InvalidInput};
}

Result<Item, Error> parse_item(const QJsonObject& obj, int index, const QDir& base) {
    const auto where = QStringLiteral("items[%1]").arg(index);

    const auto id = obj.value(QStringLiteral("id")).toString();
    if (id.isEmpty()) {
        return Result<Item, Error>::err(invalid(where + QStringLiteral(": missing \"id\"")));
    }

    const auto kind_text = obj.value(QStringLiteral("kind")).toString();
    const auto kind = parse_item_kind(kind_text.toStdString());
    if (!kind) {
        return Result<Item, Error>::err(
            invalid(where + QStringLiteral(": unknown kind \"%1\"").arg(kind_text)));
    }

    const auto path_text = obj.value(QStringLiteral("path")).toString();
    if (path_text.isEmpty()) {
        return Result<Item, Error>::err(invalid(where + QStringLiteral(": missing \"path\"")));
    }
    const QString path = QDir::cleanPath(base.absoluteFilePath(path_text));
    const QFileInfo info(path);

    Item item;
    item.id = id.toStdString();
    item.kind = *kind;
    item.source_path = path.toStdString();
    item.name = obj.value(QStringLiteral("name")).toString(info.fileName()).toStdString();

    const auto size = obj.value(QStringLiteral("size"));
    if (size.isDouble()) {
        if (size.toDouble() < 0) {
            return Result<Item, Error>::err(invalid(where + QStringLiteral(": negative size")));
        }
        item.raw_size = static_cast<int64_t>(size.toDouble());
    } else if (info.isFile()) {
        item.raw_size = info.size();
    } else {
        return Result<Item, Error>::err(Error{
            (where + QStringLiteral(": no size given and %1 is not a file").arg(path)).toStdString(),
            ErrorKind::Io});
    }

    const auto pages = obj.value(QStringLiteral("pageCount"));
    if (pages.isDouble()) {
        if (pages.toInt() <= 0) {
            return Result<Item, Error>::err(invalid(where + QStringLiteral(": pageCount must be positive")));
        }
        item.page_count = pages.toInt();
    }
    return Result<Item, Error>::ok(std::move(item));
}

} // namespace

Result<BookSnapshot, Error> parse_manifest(const QByteArray& json, const QDir& base) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError) {
        return Result<BookSnapshot, Error>::err(
            invalid(QStringLiteral("manifest is not valid JSON: %1").arg(err.errorString())));
    }
    if (!doc.isObject()) {
        return Result<BookSnapshot, Error>::err(invalid(QStringLiteral("manifest must be a JSON object")));
    }

    const auto root = doc.object();
    BookSnapshot book;
    book.title = root.value(QStringLiteral("title")).toString().toStdString();
    book.remote_folder_id = root.value(QStringLiteral("remoteFolderId")).toString().toStdString();

    const auto items = root.value(QStringLiteral("items"));
    if (!items.isArray()) {
        return Result<BookSnapshot, Error>::err(invalid(QStringLiteral("manifest has no \"items\" array")));
    }

    std::set<ItemId> seen;
    const auto array = items.toArray();
    for (int i = 0; i < array.size(); ++i) {
        if (!array.at(i).isObject()) {
            return Result<BookSnapshot, Error>::err(
                invalid(QStringLiteral("items[%1] is not an object").arg(i)));
        }
        auto item = parse_item(array.at(i).toObject(), i, base);
        if (item.is_err()) {
            return Result<BookSnapshot, Error>::err(item.unwrap_err());
        }
        if (!seen.insert(item.unwrap().id).second) {
            return Result<BookSnapshot, Error>::err(invalid(
                QStringLiteral("duplicate item id \"%1\"").arg(QString::fromStdString(item.unwrap().id))));
        }
        book.items.push_back(std::move(item).unwrap());
    }
    return Result<BookSnapshot, Error>::ok(std::move(book));
}

Result<BookSnapshot, Error> load_manifest(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<BookSnapshot, Error>::err(Error{
            QStringLiteral("cannot open manifest %1: %2").arg(path, file.errorString()).toStdString(),
            ErrorKind::Io});
    }
    return parse_manifest(file.readAll(), QFileInfo(path).absoluteDir());
}

} // namespace sheaf::storage
