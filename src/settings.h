#pragma once
#include <QString>

namespace rbx {

inline constexpr const char* kSettingsOrg = "RatingBands";
inline constexpr const char* kSettingsApp = "RatingBands";

struct AppSettings {
    QString storeDir;
    QString customLabelPrefix = QStringLiteral("attribute-colour-custom-");
    bool    createOriginalBackups = true;

    // Stored values over the defaults above.
    static AppSettings load();
    void save() const;
};

} // namespace rbx
