#pragma once
#include "core.h"
#include "document.h"
#include <QStringList>
#include <QVector>

// Object trees shaped like the game's extracted data.

namespace fixtures {

using rbx::Document;

inline Document typeTag(const char* cls) {
    Document t = Document::object();
    t.set("class", Document::fromString(cls));
    t.set("ns", Document::fromString("SI.Bibble"));
    t.set("asm", Document::fromString("Assembly-CSharp"));
    return t;
}

inline Document reference(int rid, const char* cls, const Document& rows) {
    Document data = Document::object();
    data.set("m_rows", rows);
    Document ref = Document::object();
    ref.set("rid", Document::fromNumber(rid));
    ref.set("type", typeTag(cls));
    ref.set("data", data);
    return ref;
}

inline Document wrap(const Document& list) {
    Document w = Document::object();
    w.set("Array", list);
    return w;
}

inline Document intRows(const QVector<int>& values) {
    Document rows = Document::list();
    for (int v : values) rows.append(Document::fromNumber(v));
    return rows;
}

// Two-column data collection: column 0 -> integer rows, column 1 -> string rows.
// The string reference is listed first so lookups must go through the rid.
inline Document dataCollection(const char* name, const Document& ints, const Document& strings,
                               int rowCount, bool wrapped = false) {
    Document col0 = Document::object();
    col0.set("rid", Document::fromNumber(1001));
    Document col1 = Document::object();
    col1.set("rid", Document::fromNumber(1002));
    Document columns = Document::list({col0, col1});

    Document refIds = Document::list({reference(1002, "StringDataSet", wrapped ? wrap(strings) : strings),
                                      reference(1001, "IntDataSet", wrapped ? wrap(ints) : ints)});

    Document refs = Document::object();
    refs.set("version", Document::fromNumber(2));
    refs.set("RefIds", wrapped ? wrap(refIds) : refIds);

    Document root = Document::object();
    root.set("m_Name", Document::fromString(name));
    root.set("m_columns", wrapped ? wrap(columns) : columns);
    root.set("m_rows", Document::fromNumber(rowCount));
    root.set("references", refs);
    return root;
}

inline Document rangeCollection(const QVector<int>& boundaries, const QStringList& labels,
                                bool wrapped = false) {
    return dataCollection(rbx::kRangeCollectionName, intRows(boundaries),
                          Document::list(labels), boundaries.size(), wrapped);
}

inline Document highlightCollection(const char* name, const QStringList& rows) {
    QVector<int> ids;
    for (int i = 0; i < rows.size(); i++) ids.append(i);
    return dataCollection(name, intRows(ids), Document::list(rows), rows.size());
}

inline Document colorObject(const rbx::Rgba& c) {
    Document o = Document::object();
    o.set("r", Document::fromNumber(c.r));
    o.set("g", Document::fromNumber(c.g));
    o.set("b", Document::fromNumber(c.b));
    o.set("a", Document::fromNumber(c.a));
    return o;
}

// Rule whose "color" property holds a single value descriptor.
inline Document rule(int valueType, int valueIndex) {
    Document value = Document::object();
    value.set("m_ValueType", Document::fromNumber(valueType));
    value.set("valueIndex", Document::fromNumber(valueIndex));
    Document prop = Document::object();
    prop.set("m_Name", Document::fromString("color"));
    prop.set("m_Line", Document::fromNumber(3));
    prop.set("m_Values", Document::list({value}));
    Document r = Document::object();
    r.set("m_Properties", Document::list({prop}));
    r.set("line", Document::fromNumber(2));
    return r;
}

inline Document selector(const QString& label, int ruleIndex) {
    Document part = Document::object();
    part.set("m_Value", Document::fromString(label));
    part.set("m_Type", Document::fromNumber(3));
    Document sel = Document::object();
    sel.set("m_Parts", Document::list({part}));
    sel.set("m_PreviousRelationship", Document::fromNumber(0));
    Document complex = Document::object();
    complex.set("m_Specificity", Document::fromNumber(11));
    complex.set("m_Selectors", Document::list({sel}));
    complex.set("ruleIndex", Document::fromNumber(ruleIndex));
    return complex;
}

// Preset binding rule i to colors[i] and to labels[i].
inline Document colorPreset(const QVector<rbx::Rgba>& colors, const QStringList& labels) {
    Document rules = Document::list(), colorList = Document::list(), selectors = Document::list();
    for (int i = 0; i < colors.size(); i++) {
        rules.append(rule(4, i));
        colorList.append(colorObject(colors[i]));
        selectors.append(selector(labels.value(i), i));
    }
    Document root = Document::object();
    root.set("m_Name", Document::fromString(rbx::kColorPresetName));
    root.set("m_Rules", rules);
    root.set("colors", colorList);
    root.set("floats", Document::list());
    root.set("m_ComplexSelectors", selectors);
    return root;
}

inline QStringList defaultLabels() {
    return {"attribute-colour-unset", "attribute-colour-low",
            "attribute-colour-poor", "attribute-colour-average",
            "attribute-colour-good", "attribute-colour-excellent"};
}

inline QVector<int> defaultBoundaries() { return {0, 0, 5, 10, 15, 20}; }

inline QVector<rbx::Rgba> defaultColors() {
    return {{0.0f, 0.0f, 0.0f, 1.0f}, {0.5f, 0.5f, 0.5f, 1.0f},
            {1.0f, 0.0f, 0.0f, 1.0f}, {1.0f, 0.5f, 0.0f, 1.0f},
            {0.0f, 1.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 1.0f, 1.0f}};
}

} // namespace fixtures
