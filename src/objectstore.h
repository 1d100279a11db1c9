#pragma once
#include "core.h"
#include "document.h"
#include <QHash>
#include <QString>

namespace rbx {

// Source and sink of named object trees. Readers map missing objects to
// ErrorKind::NotFound and write failures to ErrorKind::Io.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // --- Subclasses MUST implement these two ---
    virtual EditResult readObject(const QString& name, Document* out) const = 0;
    virtual EditResult writeObject(const QString& name, const Document& doc) = 0;

    // --- Optional overrides ---
    virtual bool contains(const QString& name) const {
        Document ignored;
        return readObject(name, &ignored).ok;
    }

    // Human-readable label for this store, e.g. "memory" or a directory path.
    virtual QString name() const { return {}; }
};

// ── MemoryStore ──

class MemoryStore : public ObjectStore {
public:
    MemoryStore() = default;

    EditResult readObject(const QString& name, Document* out) const override;
    EditResult writeObject(const QString& name, const Document& doc) override;
    bool contains(const QString& name) const override { return m_objects.contains(name); }
    QString name() const override { return QStringLiteral("memory"); }

    // Number of writeObject calls that succeeded.
    int writeCount() const { return m_writes; }

private:
    QHash<QString, Document> m_objects;
    int m_writes = 0;
};

// ── JsonDirStore ──
//
// One "<name>.json" file per object inside a directory, as produced by an
// external container extractor.

class JsonDirStore : public ObjectStore {
public:
    explicit JsonDirStore(const QString& dir) : m_dir(dir) {}

    EditResult readObject(const QString& name, Document* out) const override;
    EditResult writeObject(const QString& name, const Document& doc) override;
    bool contains(const QString& name) const override;
    QString name() const override { return m_dir; }

    QString dir() const { return m_dir; }
    QString pathFor(const QString& name) const;

private:
    QString m_dir;
};

} // namespace rbx
