#pragma once
#include <QJsonValue>
#include <QtGlobal>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <vector>

namespace rbx {

// ── Document ──
//
// Recursive value mirroring a serialized object tree. Objects keep their
// member order (keys[i] names items[i]); Lists use items alone.

class Document {
public:
    enum class Kind : uint8_t { Null, Bool, Number, String, Object, List };

    Document() = default;

    static Document fromBool(bool v);
    static Document fromNumber(double v);
    // Exact integral Number; keeps 64-bit ids intact through a JSON round trip.
    static Document fromInteger(qint64 v);
    static Document fromString(const QString& v);
    static Document object();
    static Document list();
    static Document list(const QStringList& strings);
    static Document list(const std::vector<Document>& items);

    Kind kind() const { return m_kind; }
    static const char* kindName(Kind k);
    const char* kindName() const { return kindName(m_kind); }

    bool isNull()   const { return m_kind == Kind::Null; }
    bool isBool()   const { return m_kind == Kind::Bool; }
    bool isNumber() const { return m_kind == Kind::Number; }
    bool isString() const { return m_kind == Kind::String; }
    bool isObject() const { return m_kind == Kind::Object; }
    bool isList()   const { return m_kind == Kind::List; }

    bool    toBool(bool def = false) const     { return isBool() ? m_bool : def; }
    bool    isInteger() const { return isNumber() && m_isInteger; }
    double  toNumber(double def = 0.0) const;
    // Rounded; `def` when not a Number or outside the int range.
    int     toInt(int def = 0) const;
    qint64  toInteger(qint64 def = 0) const { return isInteger() ? m_integer : def; }
    QString toString(const QString& def = {}) const { return isString() ? m_string : def; }

    // Object/List children. For Objects, keys() runs parallel to items().
    int size() const { return int(m_items.size()); }
    const std::vector<Document>& items() const { return m_items; }
    const QStringList& keys() const { return m_keys; }

    // ── Object access ──
    bool contains(const QString& key) const { return indexOf(key) >= 0; }
    const Document* find(const QString& key) const;
    Document*       find(const QString& key);
    // Replaces an existing member in place, or appends a new one.
    void set(const QString& key, const Document& value);
    bool remove(const QString& key);

    // ── List access ──
    void append(const Document& value);
    const Document& at(int i) const { return m_items[size_t(i)]; }
    Document&       at(int i)       { return m_items[size_t(i)]; }

    bool operator==(const Document& o) const;
    bool operator!=(const Document& o) const { return !(*this == o); }

    // JSON bridge for stores that keep extracted object dumps on disk.
    QJsonValue toJson() const;
    static Document fromJson(const QJsonValue& v);

private:
    int indexOf(const QString& key) const;

    Kind                  m_kind   = Kind::Null;
    bool                  m_bool   = false;
    double                m_number = 0.0;
    qint64                m_integer = 0;
    bool                  m_isInteger = false;
    QString               m_string;
    QStringList           m_keys;
    std::vector<Document> m_items;
};

// ── Dual-shape arrays ──
//
// A list field is either a bare List or an Object {"Array": List}.
// Returns the elements, or nullptr when the value is neither shape.
const std::vector<Document>* arrayItems(const Document& v);
bool isWrappedArray(const Document& v);

} // namespace rbx
