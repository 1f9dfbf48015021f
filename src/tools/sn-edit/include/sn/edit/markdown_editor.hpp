#pragma once

#include "sn/app_info.hpp"
#include "sn/markdown/engine.hpp"
#include "sn/markdown/line_classifier.hpp"

#define Uses_TWindow
#define Uses_TFrame
#define Uses_TScrollBar
#define Uses_TIndicator
#define Uses_TView
#define Uses_TFileEditor
#define Uses_TRect
#define Uses_TMenu
#define Uses_TEvent
#define Uses_TPoint
#define Uses_TDrawBuffer
#define Uses_TMenuBar
#define Uses_TMenuItem
#define Uses_TSubMenu
#define Uses_TStatusLine
#define Uses_TStatusItem
#define Uses_TStatusDef
#define Uses_TDeskTop
#define Uses_TFileDialog
#define Uses_TCommandSet
#define Uses_TApplication
#define Uses_MsgBox
#define Uses_TKeys
#define Uses_TProgram
#define Uses_TDialog
#define Uses_TObject
#include <tvision/tv.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sn::edit
{

inline constexpr std::string_view kAppId = "sn-edit";

inline std::string_view appName()
{
    return sn::appinfo::requireTool(kAppId).executable;
}

inline std::string_view appShortDescription()
{
    return sn::appinfo::requireTool(kAppId).shortDescription;
}

inline std::string_view appUsage()
{
    return sn::appinfo::requireTool(kAppId).usage;
}

inline std::string_view appAboutDescription()
{
    return sn::appinfo::requireTool(kAppId).aboutDescription;
}

inline constexpr ushort cmToggleTaskCheckbox = 3034;
inline constexpr ushort cmToggleSmartList = 3080;
inline constexpr ushort cmToggleRevealSyntax = 3081;
inline constexpr ushort cmAbout = 3090;

// What the status line shows for the cursor position.
struct CursorStatus
{
    bool hasEditor = false;
    bool isModified = false;
    int lineNumber = 0;
    std::string blockType;
    std::string spanKind;

    bool operator==(const CursorStatus &other) const = default;
};

class DecoratedEditor : public TFileEditor, public sn::markdown::EditorHost
{
public:
    DecoratedEditor(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll, TIndicator *indicator,
                    TStringView fileName, const sn::markdown::EngineSettings &settings) noexcept;

    std::string currentText() const override;
    sn::markdown::TextRange currentSelection() const override;
    void replaceRange(sn::markdown::TextRange range, std::string_view text) override;
    void setSelection(sn::markdown::TextRange range) override;
    void applyDecorations(const sn::markdown::DecorationList &decorations) override;

    virtual void handleEvent(TEvent &event) override;
    virtual void draw() override;

    void pollEngine(std::chrono::steady_clock::time_point now);
    void toggleTaskOnCursorLine();
    void toggleSmartListContinuation();
    void toggleRevealSyntax();
    const sn::markdown::EngineSettings &engineSettings() const noexcept { return engine.settings(); }

    CursorStatus cursorStatus() const;

private:
    struct WidgetCell
    {
        int firstColumn = 0;
        int lastColumn = 0;
        std::size_t offset = 0;
    };

    struct RowLayout
    {
        uint linePtr = 0;
        std::vector<WidgetCell> widgets;
    };

    sn::markdown::MarkdownEngine engine;
    sn::markdown::DecorationList decorations;
    std::vector<RowLayout> rowLayouts;

    std::string readRange(uint start, uint end) const;
    uint topLinePointer();
    int drawDecoratedLine(int row, uint linePtr, TAttrPair colors, int &cursorColumn);
    bool handleEngineKey(TEvent &event);
    bool handleWidgetClick(TEvent &event);
    void shiftDecorations(std::size_t position, long delta);
};

class NotesEditWindow : public TWindow
{
public:
    NotesEditWindow(const TRect &bounds, TStringView fileName, int aNumber,
                    const sn::markdown::EngineSettings &settings) noexcept;

    DecoratedEditor *editor() noexcept { return fileEditor; }
    void updateWindowTitle();

    virtual void handleEvent(TEvent &event) override;

private:
    DecoratedEditor *fileEditor = nullptr;
};

class NotesEditorApp : public TApplication
{
public:
    NotesEditorApp(const std::vector<std::string> &files, const sn::markdown::EngineSettings &settings);

    static TMenuBar *initMenuBar(TRect);
    static TStatusLine *initStatusLine(TRect);

    virtual void handleEvent(TEvent &event) override;
    virtual void idle() override;

private:
    sn::markdown::EngineSettings settings;

    NotesEditWindow *openEditor(const char *fileName, Boolean visible);
    NotesEditWindow *currentWindow();
    void fileOpen();
    void fileNew();
    void showAbout();
    void dispatchToEditor(ushort command);
    void refreshStatus();
};

} // namespace sn::edit
