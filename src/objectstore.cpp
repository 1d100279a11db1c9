#include "objectstore.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

namespace rbx {

// ── MemoryStore ──

EditResult MemoryStore::readObject(const QString& name, Document* out) const {
    auto it = m_objects.constFind(name);
    if (it == m_objects.constEnd())
        return EditResult::failure(ErrorKind::NotFound,
            QStringLiteral("object '%1' not found").arg(name));
    *out = it.value();
    return EditResult::success();
}

EditResult MemoryStore::writeObject(const QString& name, const Document& doc) {
    m_objects.insert(name, doc);
    m_writes++;
    return EditResult::success();
}

// ── JsonDirStore ──

QString JsonDirStore::pathFor(const QString& name) const {
    return QDir(m_dir).filePath(name + QStringLiteral(".json"));
}

bool JsonDirStore::contains(const QString& name) const {
    return QFileInfo::exists(pathFor(name));
}

EditResult JsonDirStore::readObject(const QString& name, Document* out) const {
    QString path = pathFor(name);
    QFile file(path);
    if (!file.exists())
        return EditResult::failure(ErrorKind::NotFound,
            QStringLiteral("object '%1' not found in %2").arg(name, m_dir));
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "JsonDirStore: cannot open" << path << file.errorString();
        return EditResult::failure(ErrorKind::Io,
            QStringLiteral("cannot open %1: %2").arg(path, file.errorString()));
    }

    QJsonParseError perr;
    QJsonDocument jdoc = QJsonDocument::fromJson(file.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !jdoc.isObject()) {
        qWarning() << "JsonDirStore: invalid JSON in" << path << perr.errorString();
        return EditResult::failure(ErrorKind::Structure,
            QStringLiteral("%1 is not a JSON object: %2").arg(path, perr.errorString()));
    }

    *out = Document::fromJson(jdoc.object());
    qDebug() << "JsonDirStore: read" << name;
    return EditResult::success();
}

EditResult JsonDirStore::writeObject(const QString& name, const Document& doc) {
    if (!QDir().mkpath(m_dir))
        return EditResult::failure(ErrorKind::Io,
            QStringLiteral("cannot create directory %1").arg(m_dir));

    QString path = pathFor(name);
    QJsonValue json = doc.toJson();
    QJsonDocument jdoc = json.isArray() ? QJsonDocument(json.toArray())
                                        : QJsonDocument(json.toObject());

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "JsonDirStore: cannot write" << path << file.errorString();
        return EditResult::failure(ErrorKind::Io,
            QStringLiteral("cannot write %1: %2").arg(path, file.errorString()));
    }
    file.write(jdoc.toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "JsonDirStore: commit failed for" << path << file.errorString();
        return EditResult::failure(ErrorKind::Io,
            QStringLiteral("cannot write %1: %2").arg(path, file.errorString()));
    }
    qDebug() << "JsonDirStore: wrote" << name;
    return EditResult::success();
}

} // namespace rbx
