#include "sn/edit/markdown_editor.hpp"

#include <cstdarg>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

namespace sn::edit
{
    namespace
    {
#ifndef SN_EDIT_VERSION
#define SN_EDIT_VERSION "0.0.0"
#endif

        ushort execDialog(TDialog *d, void *data)
        {
            TView *p = TProgram::application->validView(d);
            if (!p)
                return cmCancel;
            if (data)
                p->setData(data);
            ushort result = TProgram::deskTop->execView(p);
            if (result != cmCancel && data)
                p->getData(data);
            TObject::destroy(p);
            return result;
        }

        ushort runEditorDialog(int dialog, ...)
        {
            va_list args;
            switch (dialog)
            {
            case edOutOfMemory:
                return messageBox("Not enough memory for this operation.", mfError | mfOKButton);
            case edReadError:
            case edWriteError:
            case edCreateError:
            {
                va_start(args, dialog);
                const char *file = va_arg(args, const char *);
                va_end(args);
                std::ostringstream text;
                if (dialog == edReadError)
                    text << "Error reading note ";
                else if (dialog == edWriteError)
                    text << "Error writing note ";
                else
                    text << "Error creating note ";
                if (file && *file)
                    text << file;
                text << '.';
                return messageBox(text.str().c_str(), mfError | mfOKButton);
            }
            case edSaveModify:
            {
                va_start(args, dialog);
                const char *file = va_arg(args, const char *);
                va_end(args);
                std::ostringstream text;
                if (file && *file)
                    text << file << " has been modified. Save?";
                else
                    text << "Note has been modified. Save?";
                return messageBox(text.str().c_str(), mfConfirmation | mfYesNoCancel);
            }
            case edSaveUntitled:
                return messageBox("Save untitled note?", mfConfirmation | mfYesNoCancel);
            case edSaveAs:
            {
                va_start(args, dialog);
                char *file = va_arg(args, char *);
                va_end(args);
                return execDialog(new TFileDialog("*.md", "Save note as", "~N~ame", fdOKButton, 101), file);
            }
            default:
                return cmCancel;
            }
        }

        std::string describeStatus(const CursorStatus &status)
        {
            if (!status.hasEditor)
                return std::string();
            std::ostringstream out;
            out << "Ln " << status.lineNumber << "  " << status.blockType;
            if (!status.spanKind.empty())
                out << " / " << status.spanKind;
            if (status.isModified)
                out << "  *";
            return out.str();
        }

        class NotesStatusLine : public TStatusLine
        {
        public:
            NotesStatusLine(TRect r)
                : TStatusLine(r, *new TStatusDef(0, 0xFFFF) +
                                     *new TStatusItem("~F2~ Save", kbF2, cmSave) +
                                     *new TStatusItem("~F3~ Open", kbF3, cmOpen) +
                                     *new TStatusItem("~Ctrl-T~ Task", kbCtrlT, cmToggleTaskCheckbox) +
                                     *new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit))
            {
            }

            void setStatus(const CursorStatus &status)
            {
                if (lastStatus && *lastStatus == status)
                    return;
                lastStatus = status;
                text = describeStatus(status);
                drawView();
            }

            const char *hint(ushort helpCtx) override
            {
                if (!text.empty())
                    return text.c_str();
                return TStatusLine::hint(helpCtx);
            }

        private:
            std::optional<CursorStatus> lastStatus;
            std::string text;
        };

        TSubMenu &makeFileMenu()
        {
            return *new TSubMenu("~F~ile", kbNoKey) +
                   *new TMenuItem("~O~pen", cmOpen, kbF3, hcNoContext, "F3") +
                   *new TMenuItem("~N~ew", cmNew, kbNoKey, hcNoContext) +
                   *new TMenuItem("~S~ave", cmSave, kbF2, hcNoContext, "F2") +
                   *new TMenuItem("S~a~ve as...", cmSaveAs, kbNoKey) +
                   *new TMenuItem("~C~lose", cmClose, kbNoKey, hcNoContext) +
                   newLine() +
                   *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X");
        }

        TSubMenu &makeEditMenu()
        {
            return *new TSubMenu("~E~dit", kbNoKey) +
                   *new TMenuItem("~U~ndo", cmUndo, kbNoKey) +
                   newLine() +
                   *new TMenuItem("Cu~t~", cmCut, kbShiftDel, hcNoContext, "Shift-Del") +
                   *new TMenuItem("~C~opy", cmCopy, kbCtrlIns, hcNoContext, "Ctrl-Ins") +
                   *new TMenuItem("~P~aste", cmPaste, kbShiftIns, hcNoContext, "Shift-Ins");
        }

        TSubMenu &makeMarkdownMenu()
        {
            return *new TSubMenu("~M~arkdown", kbNoKey) +
                   *new TMenuItem("Toggle ~t~ask", cmToggleTaskCheckbox, kbCtrlT, hcNoContext, "Ctrl-T") +
                   newLine() +
                   *new TMenuItem("Smart ~l~ist continuation", cmToggleSmartList, kbNoKey) +
                   *new TMenuItem("~R~eveal syntax on cursor line", cmToggleRevealSyntax, kbNoKey);
        }

        TSubMenu &makeHelpMenu()
        {
            return *new TSubMenu("~H~elp", kbNoKey) + *new TMenuItem("~A~bout", cmAbout, kbNoKey);
        }

    } // namespace

    NotesEditWindow::NotesEditWindow(const TRect &bounds, TStringView fileName, int aNumber,
                                     const sn::markdown::EngineSettings &settings) noexcept
        : TWindowInit(&TWindow::initFrame), TWindow(bounds, nullptr, aNumber)
    {
        options |= ofTileable;

        auto *indicator = new TIndicator(TRect(2, size.y - 1, 16, size.y));
        insert(indicator);

        auto *hScrollBar = new TScrollBar(TRect(18, size.y - 1, size.x - 2, size.y));
        insert(hScrollBar);

        auto *vScrollBar = new TScrollBar(TRect(size.x - 1, 1, size.x, size.y - 1));
        insert(vScrollBar);

        TRect editorRect(1, 1, size.x - 1, size.y - 1);
        fileEditor = new DecoratedEditor(editorRect, hScrollBar, vScrollBar, indicator, fileName, settings);
        insert(fileEditor);
        updateWindowTitle();
    }

    void NotesEditWindow::updateWindowTitle()
    {
        if (!fileEditor)
            return;

        std::string displayName = "Untitled";
        if (fileEditor->fileName[0] != '\0')
        {
            std::filesystem::path path(fileEditor->fileName);
            displayName = path.filename().string();
            if (displayName.empty())
                displayName = path.string();
        }

        delete[] const_cast<char *>(title);
        title = newStr(displayName.c_str());
        if (frame)
            frame->drawView();
    }

    void NotesEditWindow::handleEvent(TEvent &event)
    {
        TWindow::handleEvent(event);
        if (event.what == evBroadcast && event.message.command == cmUpdateTitle)
        {
            updateWindowTitle();
            clearEvent(event);
        }
    }

    NotesEditorApp::NotesEditorApp(const std::vector<std::string> &files,
                                   const sn::markdown::EngineSettings &engineSettings)
        : TProgInit(&NotesEditorApp::initStatusLine, &NotesEditorApp::initMenuBar, &TApplication::initDeskTop),
          TApplication(), settings(engineSettings)
    {
        TEditor::editorDialog = runEditorDialog;

        TCommandSet ts;
        ts.enableCmd(cmSave);
        ts.enableCmd(cmSaveAs);
        ts.enableCmd(cmCut);
        ts.enableCmd(cmCopy);
        ts.enableCmd(cmPaste);
        ts.enableCmd(cmClear);
        ts.enableCmd(cmUndo);
        disableCommands(ts);

        for (const auto &file : files)
            openEditor(file.c_str(), True);
        if (files.empty())
            fileNew();
        cascade();
        refreshStatus();
    }

    NotesEditWindow *NotesEditorApp::openEditor(const char *fileName, Boolean visible)
    {
        TRect r = deskTop->getExtent();
        auto *win = (NotesEditWindow *)validView(new NotesEditWindow(r, fileName, wnNoNumber, settings));
        if (!win)
            return nullptr;
        if (!visible)
            win->hide();
        deskTop->insert(win);
        return win;
    }

    NotesEditWindow *NotesEditorApp::currentWindow()
    {
        if (!deskTop || !deskTop->current)
            return nullptr;
        return dynamic_cast<NotesEditWindow *>(deskTop->current);
    }

    void NotesEditorApp::fileOpen()
    {
        char name[MAXPATH] = "*.md";
        if (execDialog(new TFileDialog("*.md", "Open note", "~N~ame", fdOpenButton, 100), name) != cmCancel)
            openEditor(name, True);
    }

    void NotesEditorApp::fileNew()
    {
        openEditor(nullptr, True);
    }

    void NotesEditorApp::showAbout()
    {
        std::ostringstream text;
        text << appName() << ' ' << SN_EDIT_VERSION << "\n\n" << appAboutDescription();
        messageBox(text.str().c_str(), mfInformation | mfOKButton);
    }

    void NotesEditorApp::dispatchToEditor(ushort command)
    {
        auto *win = currentWindow();
        if (!win || !win->editor())
            return;
        DecoratedEditor *ed = win->editor();
        switch (command)
        {
        case cmToggleSmartList:
            ed->toggleSmartListContinuation();
            settings.smartListContinuation = ed->engineSettings().smartListContinuation;
            break;
        case cmToggleRevealSyntax:
            ed->toggleRevealSyntax();
            settings.revealActiveLine = ed->engineSettings().revealActiveLine;
            break;
        default:
        {
            TEvent ev;
            ev.what = evCommand;
            ev.message.command = command;
            ev.message.infoPtr = nullptr;
            ed->handleEvent(ev);
            break;
        }
        }
    }

    void NotesEditorApp::handleEvent(TEvent &event)
    {
        TApplication::handleEvent(event);
        if (event.what != evCommand)
        {
            refreshStatus();
            return;
        }

        bool handled = true;
        switch (event.message.command)
        {
        case cmOpen:
            fileOpen();
            break;
        case cmNew:
            fileNew();
            break;
        case cmToggleTaskCheckbox:
        case cmToggleSmartList:
        case cmToggleRevealSyntax:
            dispatchToEditor(event.message.command);
            break;
        case cmAbout:
            showAbout();
            break;
        default:
            handled = false;
            break;
        }
        if (handled)
            clearEvent(event);
        refreshStatus();
    }

    void NotesEditorApp::idle()
    {
        TApplication::idle();

        auto now = std::chrono::steady_clock::now();
        if (deskTop)
        {
            deskTop->forEach(
                [](TView *view, void *arg) {
                    if (auto *win = dynamic_cast<NotesEditWindow *>(view))
                    {
                        if (auto *ed = win->editor())
                            ed->pollEngine(*static_cast<std::chrono::steady_clock::time_point *>(arg));
                    }
                },
                &now);
        }
        refreshStatus();
    }

    void NotesEditorApp::refreshStatus()
    {
        auto *line = dynamic_cast<NotesStatusLine *>(statusLine);
        if (!line)
            return;
        CursorStatus status;
        if (auto *win = currentWindow())
        {
            if (auto *ed = win->editor())
                status = ed->cursorStatus();
        }
        line->setStatus(status);
    }

    TMenuBar *NotesEditorApp::initMenuBar(TRect r)
    {
        r.b.y = r.a.y + 1;
        return new TMenuBar(r, makeFileMenu() + makeEditMenu() + makeMarkdownMenu() + makeHelpMenu());
    }

    TStatusLine *NotesEditorApp::initStatusLine(TRect r)
    {
        r.a.y = r.b.y - 1;
        return new NotesStatusLine(r);
    }

} // namespace sn::edit
