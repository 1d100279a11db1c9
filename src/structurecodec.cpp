#include "structurecodec.h"
#include <QDebug>
#include <QSet>
#include <climits>
#include <cmath>

namespace rbx {

QString StructureError::message() const {
    return QStringLiteral("%1: expected %2, found %3").arg(path, expected, actual);
}

namespace codec {

namespace {

// ── Field names ──

const QString kArray       = QStringLiteral("Array");
const QString kRules       = QStringLiteral("m_Rules");
const QString kProperties  = QStringLiteral("m_Properties");
const QString kValues      = QStringLiteral("m_Values");
const QString kSelectors   = QStringLiteral("m_ComplexSelectors");
const QString kColors      = QStringLiteral("colors");
const QString kFloats      = QStringLiteral("floats");
const QString kColumns     = QStringLiteral("m_columns");
const QString kReferences  = QStringLiteral("references");
const QString kRefIds      = QStringLiteral("RefIds");
const QString kRows        = QStringLiteral("m_rows");

// Keys whose string values are free text.
const QSet<QString>& nameFields() {
    static const QSet<QString> s = {
        QStringLiteral("m_Name"), QStringLiteral("m_Value"),
        QStringLiteral("class"), QStringLiteral("ns"), QStringLiteral("asm"),
    };
    return s;
}

QString describe(const Document* v) {
    return v ? QString::fromLatin1(v->kindName()) : QStringLiteral("missing");
}

QString member(const QString& path, const QString& key) {
    return path + QLatin1Char('.') + key;
}

QString element(const QString& path, int i) {
    return path + QLatin1Char('[') + QString::number(i) + QLatin1Char(']');
}

// Path prefix for the elements of a dual-shape array field.
QString elementsPath(const QString& fieldPath, const Document& field) {
    return isWrappedArray(field) ? member(fieldPath, kArray) : fieldPath;
}

bool fail(StructureError* err, const QString& path, const QString& expected, const QString& actual) {
    if (err) *err = {path, expected, actual};
    return false;
}

// Rebuilt array in the shape the original field used.
Document sameShape(const Document* original, const std::vector<Document>& items) {
    if (original && isWrappedArray(*original)) {
        Document wrapped = *original;
        wrapped.set(kArray, Document::list(items));
        return wrapped;
    }
    return Document::list(items);
}

// ── Validator ──

class Validator {
public:
    explicit Validator(StructureError* err) : m_err(err) {}

    bool run(const Document& doc, ObjectShape shape) {
        if (!doc.isObject())
            return fail(m_err, QStringLiteral("root"), QStringLiteral("Object"), describe(&doc));

        switch (shape) {
        case ObjectShape::ColorPreset:
            return colorPreset(doc);
        case ObjectShape::RangeCollection:
        case ObjectShape::HighlightToggle:
            return dataCollection(doc);
        }
        return true;
    }

private:
    StructureError* m_err;

    bool colorPreset(const Document& root) {
        const QString base = QStringLiteral("root");

        if (const Document* rules = root.find(kRules)) {
            QString fieldPath = member(base, kRules);
            const auto* items = listField(*rules, fieldPath);
            if (!items) return false;
            QString prefix = elementsPath(fieldPath, *rules);
            for (int i = 0; i < int(items->size()); i++)
                if (!rule(items->at(size_t(i)), element(prefix, i))) return false;
        }

        if (const Document* selectors = root.find(kSelectors)) {
            QString fieldPath = member(base, kSelectors);
            const auto* items = listField(*selectors, fieldPath);
            if (!items) return false;
            QString prefix = elementsPath(fieldPath, *selectors);
            for (int i = 0; i < int(items->size()); i++) {
                const Document& sel = items->at(size_t(i));
                QString path = element(prefix, i);
                if (!sel.isObject())
                    return fail(m_err, path, QStringLiteral("Object"), describe(&sel));
                if (!strings(sel, path, QString(), false)) return false;
            }
        }

        for (const QString& key : {kColors, kFloats}) {
            if (const Document* field = root.find(key)) {
                QString fieldPath = member(base, key);
                if (!listField(*field, fieldPath)) return false;
                if (!strings(*field, fieldPath, key, false)) return false;
            }
        }
        return true;
    }

    bool rule(const Document& r, const QString& path) {
        if (!r.isObject())
            return fail(m_err, path, QStringLiteral("Object"), describe(&r));

        const Document* props = r.find(kProperties);
        QString propsPath = member(path, kProperties);
        if (!props)
            return fail(m_err, propsPath, QStringLiteral("List"), describe(props));
        const auto* propItems = listField(*props, propsPath);
        if (!propItems) return false;

        QString propPrefix = elementsPath(propsPath, *props);
        for (int j = 0; j < int(propItems->size()); j++) {
            const Document& prop = propItems->at(size_t(j));
            QString propPath = element(propPrefix, j);
            if (!prop.isObject())
                return fail(m_err, propPath, QStringLiteral("Object"), describe(&prop));

            const Document* values = prop.find(kValues);
            QString valuesPath = member(propPath, kValues);
            if (!values)
                return fail(m_err, valuesPath, QStringLiteral("List"), describe(values));
            const auto* valueItems = listField(*values, valuesPath);
            if (!valueItems) return false;

            QString valuePrefix = elementsPath(valuesPath, *values);
            for (int k = 0; k < int(valueItems->size()); k++) {
                const Document& v = valueItems->at(size_t(k));
                if (!v.isObject())
                    return fail(m_err, element(valuePrefix, k), QStringLiteral("Object"), describe(&v));
            }
        }
        return strings(r, path, QString(), false);
    }

    bool dataCollection(const Document& root) {
        const QString base = QStringLiteral("root");

        if (const Document* columns = root.find(kColumns)) {
            QString fieldPath = member(base, kColumns);
            const auto* items = listField(*columns, fieldPath);
            if (!items) return false;
            QString prefix = elementsPath(fieldPath, *columns);
            for (int i = 0; i < int(items->size()); i++) {
                const Document& col = items->at(size_t(i));
                if (!col.isObject())
                    return fail(m_err, element(prefix, i), QStringLiteral("Object"), describe(&col));
            }
            if (!strings(*columns, fieldPath, kColumns, false)) return false;
        }

        if (const Document* refs = root.find(kReferences)) {
            QString refsPath = member(base, kReferences);
            if (!refs->isObject())
                return fail(m_err, refsPath, QStringLiteral("Object"), describe(refs));
            if (const Document* ids = refs->find(kRefIds)) {
                QString idsPath = member(refsPath, kRefIds);
                const auto* items = listField(*ids, idsPath);
                if (!items) return false;
                QString prefix = elementsPath(idsPath, *ids);
                for (int i = 0; i < int(items->size()); i++) {
                    const Document& ref = items->at(size_t(i));
                    if (!ref.isObject())
                        return fail(m_err, element(prefix, i), QStringLiteral("Object"), describe(&ref));
                }
            }
            if (!strings(*refs, refsPath, kReferences, false)) return false;
        }
        return true;
    }

    const std::vector<Document>* listField(const Document& field, const QString& path) {
        const auto* items = arrayItems(field);
        if (!items)
            fail(m_err, path, QStringLiteral("List"), describe(&field));
        return items;
    }

    // Strings are legal only in row lists and name fields.
    bool strings(const Document& v, const QString& path, const QString& key, bool inRows) {
        switch (v.kind()) {
        case Document::Kind::String:
            if (inRows || nameFields().contains(key)) return true;
            return fail(m_err, path, QStringLiteral("non-string value"), QStringLiteral("String"));
        case Document::Kind::Object:
            for (int i = 0; i < v.size(); i++) {
                const QString& childKey = v.keys().at(i);
                bool rows = inRows || childKey == kRows;
                // {"Array": [...]} wrappers inherit the field's key
                QString effectiveKey = (childKey == kArray) ? key : childKey;
                if (!strings(v.at(i), member(path, childKey), effectiveKey, rows)) return false;
            }
            return true;
        case Document::Kind::List:
            for (int i = 0; i < v.size(); i++)
                if (!strings(v.at(i), element(path, i), key, inRows)) return false;
            return true;
        default:
            return true;
        }
    }
};

// ── Side-table resolution ──

struct ColumnRef {
    int     refIndex = -1;    // position inside RefIds
    QString rowsPath;         // path of the reference's row list
};

const Document* refIdsField(const Document& root) {
    const Document* refs = root.find(kReferences);
    return (refs && refs->isObject()) ? refs->find(kRefIds) : nullptr;
}

bool resolveColumn(const Document& root, int column, const char* typeTag,
                   ColumnRef* out, StructureError* err) {
    const Document* columnsField = root.find(kColumns);
    const auto* columns = columnsField ? arrayItems(*columnsField) : nullptr;
    if (!columns)
        return fail(err, QStringLiteral("root.m_columns"), QStringLiteral("List"), describe(columnsField));
    if (columns->size() < 2)
        return fail(err, QStringLiteral("root.m_columns"), QStringLiteral("2 columns"),
                    QString::number(columns->size()));

    QString colPath = element(elementsPath(QStringLiteral("root.m_columns"), *columnsField), column);
    const Document* rid = columns->at(size_t(column)).find(QStringLiteral("rid"));
    if (!rid)
        return fail(err, member(colPath, QStringLiteral("rid")), QStringLiteral("reference id"), describe(rid));

    const Document* idsField = refIdsField(root);
    const auto* refs = idsField ? arrayItems(*idsField) : nullptr;
    if (!refs)
        return fail(err, QStringLiteral("root.references.RefIds"), QStringLiteral("List"), describe(idsField));

    QString refsPrefix = elementsPath(QStringLiteral("root.references.RefIds"), *idsField);
    const QString tag = QString::fromLatin1(typeTag);
    for (int i = 0; i < int(refs->size()); i++) {
        const Document& ref = refs->at(size_t(i));
        const Document* refRid = ref.find(QStringLiteral("rid"));
        if (!refRid || *refRid != *rid) continue;
        const Document* type = ref.find(QStringLiteral("type"));
        const Document* cls = type ? type->find(QStringLiteral("class")) : nullptr;
        if (!cls || cls->toString() != tag) continue;

        out->refIndex = i;
        out->rowsPath = member(member(element(refsPrefix, i), QStringLiteral("data")), kRows);
        return true;
    }
    return fail(err, QStringLiteral("root.references.RefIds"),
                QStringLiteral("%1 for column %2").arg(tag).arg(column), QStringLiteral("missing"));
}

const Document* rowsField(const Document& root, const ColumnRef& col) {
    const auto* refs = arrayItems(*refIdsField(root));
    const Document* data = refs->at(size_t(col.refIndex)).find(QStringLiteral("data"));
    return (data && data->isObject()) ? data->find(kRows) : nullptr;
}

bool readIntRows(const Document& root, const ColumnRef& col, QVector<int>* out, StructureError* err) {
    const Document* field = rowsField(root, col);
    const auto* rows = field ? arrayItems(*field) : nullptr;
    if (!rows)
        return fail(err, col.rowsPath, QStringLiteral("List"), describe(field));
    QString prefix = elementsPath(col.rowsPath, *field);
    QVector<int> values;
    for (int i = 0; i < int(rows->size()); i++) {
        const Document& v = rows->at(size_t(i));
        if (!v.isNumber())
            return fail(err, element(prefix, i), QStringLiteral("Number"), describe(&v));
        double n = v.toNumber();
        if (!std::isfinite(n) || n != std::floor(n) || n < INT_MIN || n > INT_MAX)
            return fail(err, element(prefix, i), QStringLiteral("integer"), QString::number(n));
        values.append(v.toInt());
    }
    *out = values;
    return true;
}

bool readStringRows(const Document& root, const ColumnRef& col, QStringList* out, StructureError* err) {
    const Document* field = rowsField(root, col);
    const auto* rows = field ? arrayItems(*field) : nullptr;
    if (!rows)
        return fail(err, col.rowsPath, QStringLiteral("List"), describe(field));
    QString prefix = elementsPath(col.rowsPath, *field);
    QStringList values;
    for (int i = 0; i < int(rows->size()); i++) {
        const Document& v = rows->at(size_t(i));
        if (!v.isString())
            return fail(err, element(prefix, i), QStringLiteral("String"), describe(&v));
        values.append(v.toString());
    }
    *out = values;
    return true;
}

// Copy of `root` with the listed references' row lists replaced.
// Everything else, including the shape of each touched field, passes through.
Document replaceRows(const Document& root, const QVector<QPair<int, Document>>& rowsByRef,
                     bool keepRowShape) {
    const Document* idsField = refIdsField(root);
    std::vector<Document> refs = *arrayItems(*idsField);

    for (const auto& entry : rowsByRef) {
        Document& ref = refs[size_t(entry.first)];
        Document data = ref.find(QStringLiteral("data")) ? *ref.find(QStringLiteral("data"))
                                                        : Document::object();
        const Document* oldRows = data.find(kRows);
        data.set(kRows, keepRowShape ? sameShape(oldRows, entry.second.items())
                                     : entry.second);
        ref.set(QStringLiteral("data"), data);
    }

    Document references = *root.find(kReferences);
    references.set(kRefIds, sameShape(idsField, refs));

    Document out = Document::object();
    for (int i = 0; i < root.size(); i++) {
        const QString& key = root.keys().at(i);
        out.set(key, key == kReferences ? references : root.at(i));
    }
    return out;
}

// ── Color rule helpers ──

Rgba colorFromObject(const Document& o) {
    return {float(o.find(QStringLiteral("r")) ? o.find(QStringLiteral("r"))->toNumber(1.0) : 1.0),
            float(o.find(QStringLiteral("g")) ? o.find(QStringLiteral("g"))->toNumber(1.0) : 1.0),
            float(o.find(QStringLiteral("b")) ? o.find(QStringLiteral("b"))->toNumber(1.0) : 1.0),
            float(o.find(QStringLiteral("a")) ? o.find(QStringLiteral("a"))->toNumber(1.0) : 1.0)};
}

// Value descriptors of the rule's "color" property, or nullptr.
const std::vector<Document>* colorDescriptors(const Document& rule) {
    const Document* propsField = rule.find(kProperties);
    const auto* props = propsField ? arrayItems(*propsField) : nullptr;
    if (!props) return nullptr;
    for (const auto& prop : *props) {
        const Document* name = prop.find(QStringLiteral("m_Name"));
        if (!name || name->toString() != QLatin1String("color")) continue;
        const Document* values = prop.find(kValues);
        return values ? arrayItems(*values) : nullptr;
    }
    return nullptr;
}

bool resolveRuleColor(const Document& rule, const std::vector<Document>& colors,
                      const std::vector<Document>& floats, Rgba* out) {
    const auto* values = colorDescriptors(rule);
    if (!values) return false;

    for (const auto& v : *values) {
        const Document* typeField = v.find(QStringLiteral("m_ValueType"));
        const Document* indexField = v.find(QStringLiteral("valueIndex"));
        int type = typeField ? typeField->toInt(-1) : -1;
        int idx = indexField ? indexField->toInt(0) : 0;
        if (idx < 0) continue;

        if (type == wire::kColorValueType) {
            if (idx < int(colors.size()) && colors[size_t(idx)].isObject()) {
                *out = colorFromObject(colors[size_t(idx)]);
                return true;
            }
        } else if (type == wire::kFloatValueType) {
            auto channel = [&](int i, double def) {
                return i < int(floats.size()) ? floats[size_t(i)].toNumber(def) : def;
            };
            if (idx + 2 < int(floats.size())) {
                *out = {float(channel(idx, 1.0)), float(channel(idx + 1, 1.0)),
                        float(channel(idx + 2, 1.0)), float(channel(idx + 3, 1.0))};
                return true;
            }
        }
    }
    return false;
}

QString selectorLabel(const Document& selector) {
    const Document* selsField = selector.find(QStringLiteral("m_Selectors"));
    const auto* sels = selsField ? arrayItems(*selsField) : nullptr;
    if (!sels || sels->empty()) return {};
    const Document* partsField = sels->front().find(QStringLiteral("m_Parts"));
    const auto* parts = partsField ? arrayItems(*partsField) : nullptr;
    if (!parts || parts->empty()) return {};
    const Document* value = parts->front().find(QStringLiteral("m_Value"));
    return value ? value->toString() : QString();
}

Document makeColor(const Rgba& c) {
    Document o = Document::object();
    o.set(QStringLiteral("r"), Document::fromNumber(c.r));
    o.set(QStringLiteral("g"), Document::fromNumber(c.g));
    o.set(QStringLiteral("b"), Document::fromNumber(c.b));
    o.set(QStringLiteral("a"), Document::fromNumber(c.a));
    return o;
}

Document makeRule(int i) {
    Document value = Document::object();
    value.set(QStringLiteral("m_ValueType"), Document::fromNumber(wire::kColorValueType));
    value.set(QStringLiteral("valueIndex"), Document::fromNumber(i));

    Document prop = Document::object();
    prop.set(QStringLiteral("m_Name"), Document::fromString(QStringLiteral("color")));
    prop.set(QStringLiteral("m_Line"), Document::fromNumber(3 + i * 4));
    prop.set(kValues, Document::list({value}));

    Document rule = Document::object();
    rule.set(kProperties, Document::list({prop}));
    rule.set(QStringLiteral("line"), Document::fromNumber(2 + i * 4));
    return rule;
}

Document makeSelector(const QString& label, int i) {
    Document part = Document::object();
    part.set(QStringLiteral("m_Value"), Document::fromString(label));
    part.set(QStringLiteral("m_Type"), Document::fromNumber(wire::kSelectorPartType));

    Document sel = Document::object();
    sel.set(QStringLiteral("m_Parts"), Document::list({part}));
    sel.set(QStringLiteral("m_PreviousRelationship"), Document::fromNumber(0));

    Document complex = Document::object();
    complex.set(QStringLiteral("m_Specificity"), Document::fromNumber(wire::kSelectorSpecificity));
    complex.set(QStringLiteral("m_Selectors"), Document::list({sel}));
    complex.set(QStringLiteral("ruleIndex"), Document::fromNumber(i));
    return complex;
}

} // namespace

// ── Validation ──

bool validateDocument(const Document& doc, ObjectShape shape, StructureError* err) {
    Validator v(err);
    return v.run(doc, shape);
}

// ── Range/label collection ──

bool decodeRangeCollection(const Document& doc, RangeCollection* out, StructureError* err) {
    if (!validateDocument(doc, ObjectShape::RangeCollection, err)) return false;

    ColumnRef intCol, strCol;
    if (!resolveColumn(doc, 0, wire::kIntDataSet, &intCol, err)) return false;
    if (!resolveColumn(doc, 1, wire::kStringDataSet, &strCol, err)) return false;

    RangeCollection value;
    if (!readIntRows(doc, intCol, &value.boundaries, err)) return false;
    if (!readStringRows(doc, strCol, &value.labels, err)) return false;

    if (value.boundaries.size() != value.labels.size())
        return fail(err, QStringLiteral("root.references.RefIds"),
                    QStringLiteral("%1 labels").arg(value.boundaries.size()),
                    QString::number(value.labels.size()));

    *out = value;
    return true;
}

bool encodeRangeCollection(const RangeCollection& value, const Document& original,
                           Document* out, StructureError* err) {
    if (!validateDocument(original, ObjectShape::RangeCollection, err)) return false;
    if (value.boundaries.size() != value.labels.size())
        return fail(err, QStringLiteral("root"),
                    QStringLiteral("%1 labels").arg(value.boundaries.size()),
                    QString::number(value.labels.size()));

    ColumnRef intCol, strCol;
    if (!resolveColumn(original, 0, wire::kIntDataSet, &intCol, err)) return false;
    if (!resolveColumn(original, 1, wire::kStringDataSet, &strCol, err)) return false;

    Document intRows = Document::list();
    for (int b : value.boundaries)
        intRows.append(Document::fromNumber(b));

    Document rebuilt = replaceRows(original,
        {qMakePair(intCol.refIndex, intRows),
         qMakePair(strCol.refIndex, Document::list(value.labels))},
        true);
    rebuilt.set(kRows, Document::fromNumber(value.boundaries.size()));

    if (!validateDocument(rebuilt, ObjectShape::RangeCollection, err)) return false;
    *out = rebuilt;
    return true;
}

// ── Color preset ──

bool decodeColorPreset(const Document& doc, ColorPreset* out, StructureError* err) {
    if (!validateDocument(doc, ObjectShape::ColorPreset, err)) return false;

    static const std::vector<Document> kNone;
    auto listOf = [&](const QString& key) -> const std::vector<Document>& {
        const Document* field = doc.find(key);
        const auto* items = field ? arrayItems(*field) : nullptr;
        return items ? *items : kNone;
    };
    const auto& rules = listOf(kRules);
    const auto& colors = listOf(kColors);
    const auto& floats = listOf(kFloats);
    const auto& selectors = listOf(kSelectors);

    ColorPreset value;
    for (int i = 0; i < int(rules.size()); i++) {
        Rgba c;
        if (resolveRuleColor(rules[size_t(i)], colors, floats, &c)) {
            value.colors.append(c);
        } else if (colors.size() == rules.size() && colors[size_t(i)].isObject()) {
            value.colors.append(colorFromObject(colors[size_t(i)]));
        }
    }

    if (value.colors.size() != int(rules.size())) {
        qWarning() << "StructureCodec: resolved" << value.colors.size() << "of" << rules.size()
                   << "rule colors, defaulting all to white";
        value.colors = QVector<Rgba>(int(rules.size()), Rgba::white());
        value.fallbackApplied = true;
    }

    value.labels = QStringList();
    for (int i = 0; i < int(rules.size()); i++) value.labels.append(QString());
    for (const auto& sel : selectors) {
        const Document* ruleIndex = sel.find(QStringLiteral("ruleIndex"));
        int idx = ruleIndex ? ruleIndex->toInt(-1) : -1;
        if (idx >= 0 && idx < value.labels.size())
            value.labels[idx] = selectorLabel(sel);
    }

    *out = value;
    return true;
}

bool encodeColorPreset(const QVector<Rgba>& colors, const QStringList& labels,
                       const Document& original, Document* out, StructureError* err) {
    if (!validateDocument(original, ObjectShape::ColorPreset, err)) return false;
    if (colors.size() != labels.size())
        return fail(err, QStringLiteral("root"),
                    QStringLiteral("%1 labels").arg(colors.size()),
                    QString::number(labels.size()));

    std::vector<Document> colorItems, ruleItems, selectorItems;
    for (int i = 0; i < colors.size(); i++) {
        colorItems.push_back(makeColor(colors[i]));
        ruleItems.push_back(makeRule(i));
        selectorItems.push_back(makeSelector(labels[i], i));
    }

    const Document rebuiltRules = Document::list(ruleItems);
    const Document rebuiltSelectors = Document::list(selectorItems);
    const Document rebuiltColors = Document::list(colorItems);

    Document rebuilt = Document::object();
    for (int i = 0; i < original.size(); i++) {
        const QString& key = original.keys().at(i);
        if (key == kRules)          rebuilt.set(key, rebuiltRules);
        else if (key == kSelectors) rebuilt.set(key, rebuiltSelectors);
        else if (key == kColors)    rebuilt.set(key, rebuiltColors);
        else                        rebuilt.set(key, original.at(i));
    }
    if (!rebuilt.contains(kRules))     rebuilt.set(kRules, rebuiltRules);
    if (!rebuilt.contains(kSelectors)) rebuilt.set(kSelectors, rebuiltSelectors);
    if (!rebuilt.contains(kColors))    rebuilt.set(kColors, rebuiltColors);

    if (!validateDocument(rebuilt, ObjectShape::ColorPreset, err)) return false;
    *out = rebuilt;
    return true;
}

// ── Highlight toggle ──

bool decodeHighlightToggle(const Document& doc, HighlightVariant variant,
                           HighlightToggle* out, StructureError* err) {
    if (!validateDocument(doc, ObjectShape::HighlightToggle, err)) return false;

    ColumnRef strCol;
    if (!resolveColumn(doc, 1, wire::kStringDataSet, &strCol, err)) return false;

    HighlightToggle value;
    if (!readStringRows(doc, strCol, &value.rows, err)) return false;

    const HighlightMeta* meta = highlightMeta(variant);
    const QString base = meta ? QString::fromLatin1(meta->labels[0]) : QString();
    value.enabled = !(value.rows.size() >= 3
                      && value.rows[0] == base
                      && value.rows[1] == base
                      && value.rows[2] == base);
    *out = value;
    return true;
}

bool encodeHighlightToggle(bool enabled, HighlightVariant variant, const Document& original,
                           Document* out, StructureError* err) {
    if (!validateDocument(original, ObjectShape::HighlightToggle, err)) return false;

    ColumnRef strCol;
    if (!resolveColumn(original, 1, wire::kStringDataSet, &strCol, err)) return false;

    Document rebuilt = replaceRows(original,
        {qMakePair(strCol.refIndex, Document::list(highlightRows(variant, enabled)))},
        false);

    if (!validateDocument(rebuilt, ObjectShape::HighlightToggle, err)) return false;
    *out = rebuilt;
    return true;
}

} // namespace codec

} // namespace rbx
