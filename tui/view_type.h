#ifndef GCM_TUI_VIEW_TYPE_H
#define GCM_TUI_VIEW_TYPE_H

#include <string>

namespace gcm {

enum class ViewType {
    ExtensionList,
    ExtensionDetail,
    ExtensionCreate,
    ExtensionEdit,
    ExtensionImport,
    ProfileList,
    ProfileDetail,
    ProfileCreate,
    ProfileEdit,
    ConfirmDelete,
    Settings,
};

// Views that take typed text, so global key bindings stay quiet
inline bool isFormView(ViewType view) {
    switch (view) {
        case ViewType::ExtensionCreate:
        case ViewType::ExtensionEdit:
        case ViewType::ExtensionImport:
        case ViewType::ProfileCreate:
        case ViewType::ProfileEdit:
            return true;
        default:
            return false;
    }
}

inline std::string viewName(ViewType view) {
    switch (view) {
        case ViewType::ExtensionList: return "ExtensionList";
        case ViewType::ExtensionDetail: return "ExtensionDetail";
        case ViewType::ExtensionCreate: return "ExtensionCreate";
        case ViewType::ExtensionEdit: return "ExtensionEdit";
        case ViewType::ExtensionImport: return "ExtensionImport";
        case ViewType::ProfileList: return "ProfileList";
        case ViewType::ProfileDetail: return "ProfileDetail";
        case ViewType::ProfileCreate: return "ProfileCreate";
        case ViewType::ProfileEdit: return "ProfileEdit";
        case ViewType::ConfirmDelete: return "ConfirmDelete";
        case ViewType::Settings: return "Settings";
    }
    return "Unknown";
}

}  // namespace gcm

#endif  // GCM_TUI_VIEW_TYPE_H
