#ifndef GCM_TUI_COMPONENTS_TAB_BAR_H
#define GCM_TUI_COMPONENTS_TAB_BAR_H

#include "component.h"
#include "view_type.h"

namespace gcm {
namespace components {

// Top strip: Extensions / Profiles / Settings tabs plus a breadcrumb for
// sub-views. The active tab follows the view manager's current view.
class TabBar : public Component {
public:
    void setCurrentView(ViewType view) { current_ = view; }
    ViewType currentView() const { return current_; }

    // 0 = Extensions, 1 = Profiles, 2 = Settings; -1 for none
    int activeTab() const;
    std::string breadcrumb() const;

    ftxui::Element draw(const ColorTheme& theme) override;

private:
    ViewType current_ = ViewType::ExtensionList;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_TAB_BAR_H
