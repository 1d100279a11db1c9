#include "settings.h"
#include <QSettings>

namespace rbx {

AppSettings AppSettings::load() {
    AppSettings r;
    QSettings s(kSettingsOrg, kSettingsApp);
    r.storeDir = s.value("storeDir", r.storeDir).toString();
    r.customLabelPrefix = s.value("customLabelPrefix", r.customLabelPrefix).toString();
    if (r.customLabelPrefix.isEmpty())
        r.customLabelPrefix = AppSettings().customLabelPrefix;
    r.createOriginalBackups = s.value("createOriginalBackups", r.createOriginalBackups).toBool();
    return r;
}

void AppSettings::save() const {
    QSettings s(kSettingsOrg, kSettingsApp);
    s.setValue("storeDir", storeDir);
    s.setValue("customLabelPrefix", customLabelPrefix);
    s.setValue("createOriginalBackups", createOriginalBackups);
}

} // namespace rbx
