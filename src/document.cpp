#include "document.h"
#include <QJsonArray>
#include <QJsonObject>
#include <QVariant>
#include <climits>
#include <cmath>

namespace rbx {

// ── Construction ──

Document Document::fromBool(bool v) {
    Document d; d.m_kind = Kind::Bool; d.m_bool = v; return d;
}

Document Document::fromNumber(double v) {
    Document d; d.m_kind = Kind::Number; d.m_number = v; return d;
}

Document Document::fromInteger(qint64 v) {
    Document d;
    d.m_kind = Kind::Number;
    d.m_number = double(v);
    d.m_integer = v;
    d.m_isInteger = true;
    return d;
}

Document Document::fromString(const QString& v) {
    Document d; d.m_kind = Kind::String; d.m_string = v; return d;
}

Document Document::object() {
    Document d; d.m_kind = Kind::Object; return d;
}

Document Document::list() {
    Document d; d.m_kind = Kind::List; return d;
}

Document Document::list(const QStringList& strings) {
    Document d = list();
    d.m_items.reserve(size_t(strings.size()));
    for (const QString& s : strings)
        d.m_items.push_back(fromString(s));
    return d;
}

Document Document::list(const std::vector<Document>& items) {
    Document d = list();
    d.m_items = items;
    return d;
}

const char* Document::kindName(Kind k) {
    switch (k) {
    case Kind::Null:   return "Null";
    case Kind::Bool:   return "Bool";
    case Kind::Number: return "Number";
    case Kind::String: return "String";
    case Kind::Object: return "Object";
    case Kind::List:   return "List";
    }
    return "Unknown";
}

double Document::toNumber(double def) const {
    if (!isNumber()) return def;
    return m_isInteger ? double(m_integer) : m_number;
}

int Document::toInt(int def) const {
    if (!isNumber()) return def;
    if (m_isInteger) {
        if (m_integer < INT_MIN || m_integer > INT_MAX) return def;
        return int(m_integer);
    }
    if (!std::isfinite(m_number)) return def;
    double r = std::round(m_number);
    if (r < double(INT_MIN) || r > double(INT_MAX)) return def;
    return int(r);
}

// ── Object access ──

int Document::indexOf(const QString& key) const {
    if (m_kind != Kind::Object) return -1;
    return m_keys.indexOf(key);
}

const Document* Document::find(const QString& key) const {
    int i = indexOf(key);
    return i >= 0 ? &m_items[size_t(i)] : nullptr;
}

Document* Document::find(const QString& key) {
    int i = indexOf(key);
    return i >= 0 ? &m_items[size_t(i)] : nullptr;
}

void Document::set(const QString& key, const Document& value) {
    if (m_kind != Kind::Object) {
        *this = object();
    }
    int i = indexOf(key);
    if (i >= 0) {
        m_items[size_t(i)] = value;
        return;
    }
    m_keys.append(key);
    m_items.push_back(value);
}

bool Document::remove(const QString& key) {
    int i = indexOf(key);
    if (i < 0) return false;
    m_keys.removeAt(i);
    m_items.erase(m_items.begin() + i);
    return true;
}

void Document::append(const Document& value) {
    if (m_kind != Kind::List)
        *this = list();
    m_items.push_back(value);
}

bool Document::operator==(const Document& o) const {
    if (m_kind != o.m_kind) return false;
    switch (m_kind) {
    case Kind::Null:   return true;
    case Kind::Bool:   return m_bool == o.m_bool;
    case Kind::Number:
        if (m_isInteger && o.m_isInteger) return m_integer == o.m_integer;
        return toNumber() == o.toNumber();
    case Kind::String: return m_string == o.m_string;
    case Kind::Object: return m_keys == o.m_keys && m_items == o.m_items;
    case Kind::List:   return m_items == o.m_items;
    }
    return false;
}

// ── JSON bridge ──
// QJsonObject sorts its keys, so member order only survives the in-memory path.

QJsonValue Document::toJson() const {
    switch (m_kind) {
    case Kind::Null:   return QJsonValue(QJsonValue::Null);
    case Kind::Bool:   return QJsonValue(m_bool);
    case Kind::Number: return m_isInteger ? QJsonValue(m_integer) : QJsonValue(m_number);
    case Kind::String: return QJsonValue(m_string);
    case Kind::Object: {
        QJsonObject o;
        for (int i = 0; i < m_keys.size(); i++)
            o[m_keys[i]] = m_items[size_t(i)].toJson();
        return o;
    }
    case Kind::List: {
        QJsonArray arr;
        for (const auto& item : m_items)
            arr.append(item.toJson());
        return arr;
    }
    }
    return QJsonValue(QJsonValue::Null);
}

Document Document::fromJson(const QJsonValue& v) {
    switch (v.type()) {
    case QJsonValue::Bool:   return fromBool(v.toBool());
    case QJsonValue::Double: {
        // Qt 6 keeps integral JSON numbers as qint64; Qt 5 only has the double.
        const QVariant var = v.toVariant();
        if (var.userType() == QMetaType::LongLong)
            return fromInteger(var.toLongLong());
        return fromNumber(v.toDouble());
    }
    case QJsonValue::String: return fromString(v.toString());
    case QJsonValue::Array: {
        Document d = list();
        const QJsonArray arr = v.toArray();
        d.m_items.reserve(size_t(arr.size()));
        for (const auto& item : arr)
            d.m_items.push_back(fromJson(item));
        return d;
    }
    case QJsonValue::Object: {
        Document d = object();
        const QJsonObject o = v.toObject();
        for (auto it = o.begin(); it != o.end(); ++it) {
            d.m_keys.append(it.key());
            d.m_items.push_back(fromJson(it.value()));
        }
        return d;
    }
    default:
        return {};
    }
}

// ── Dual-shape arrays ──

const std::vector<Document>* arrayItems(const Document& v) {
    if (v.isList()) return &v.items();
    if (v.isObject()) {
        const Document* inner = v.find(QStringLiteral("Array"));
        if (inner && inner->isList()) return &inner->items();
    }
    return nullptr;
}

bool isWrappedArray(const Document& v) {
    if (!v.isObject()) return false;
    const Document* inner = v.find(QStringLiteral("Array"));
    return inner && inner->isList();
}

} // namespace rbx
