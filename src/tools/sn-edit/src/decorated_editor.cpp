#include "sn/edit/markdown_editor.hpp"

#include "sn/markdown/inline_scanner.hpp"
#include "sn/markdown/region_detector.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

namespace sn::edit
{
    namespace
    {
        using sn::markdown::Decoration;
        using sn::markdown::StyleTag;
        using sn::markdown::TextRange;
        using sn::markdown::WidgetKind;

        constexpr int kTabWidth = 8;

        void addStyle(TColorAttr &attr, ushort style)
        {
            ::setStyle(attr, ::getStyle(attr) | style);
        }

        void applyStyle(TColorAttr &attr, StyleTag tag)
        {
            switch (tag)
            {
            case StyleTag::SyntaxMark:
            case StyleTag::HeadingMark:
            case StyleTag::HorizontalRuleActive:
            case StyleTag::FenceLine:
            case StyleTag::FenceText:
            case StyleTag::TableSeparator:
            case StyleTag::TablePipe:
                ::setFore(attr, TColorBIOS(0x8));
                break;
            case StyleTag::Heading1:
            case StyleTag::Heading2:
                ::setFore(attr, TColorBIOS(0xF));
                addStyle(attr, slBold);
                break;
            case StyleTag::Heading3:
            case StyleTag::Heading4:
            case StyleTag::Heading5:
            case StyleTag::Heading6:
                ::setFore(attr, TColorBIOS(0xE));
                addStyle(attr, slBold);
                break;
            case StyleTag::Blockquote:
                ::setFore(attr, TColorBIOS(0x3));
                addStyle(attr, slItalic);
                break;
            case StyleTag::ListMarker:
                ::setFore(attr, TColorBIOS(0xB));
                break;
            case StyleTag::TaskDone:
                ::setFore(attr, TColorBIOS(0x8));
                addStyle(attr, slStrike);
                break;
            case StyleTag::CodeBlock:
                ::setFore(attr, TColorBIOS(0x2));
                break;
            case StyleTag::TableHeader:
                addStyle(attr, slBold);
                break;
            case StyleTag::InlineCode:
                ::setFore(attr, TColorBIOS(0xA));
                break;
            case StyleTag::Strong:
                addStyle(attr, slBold);
                break;
            case StyleTag::Emphasis:
                addStyle(attr, slItalic);
                break;
            case StyleTag::Strikethrough:
                addStyle(attr, slStrike);
                break;
            case StyleTag::Link:
                ::setFore(attr, TColorBIOS(0x9));
                addStyle(attr, slUnderline);
                break;
            case StyleTag::Url:
                ::setFore(attr, TColorBIOS(0x8));
                addStyle(attr, slUnderline);
                break;
            case StyleTag::ListIndent1:
            case StyleTag::ListIndent2:
            case StyleTag::ListIndent3:
            case StyleTag::ListIndent4:
            case StyleTag::TableRow:
                break;
            }
        }

        std::size_t utf8Length(unsigned char lead) noexcept
        {
            if (lead < 0x80)
                return 1;
            if ((lead >> 5) == 0x6)
                return 2;
            if ((lead >> 4) == 0xE)
                return 3;
            if ((lead >> 3) == 0x1E)
                return 4;
            return 1;
        }

        std::string_view widgetGlyph(const sn::markdown::ReplaceWithWidget &widget)
        {
            switch (widget.widget)
            {
            case WidgetKind::Checkbox:
                return widget.state.checked ? "\xE2\x98\x91 " : "\xE2\x98\x90 ";
            case WidgetKind::Bullet:
                return "\xE2\x80\xA2 ";
            case WidgetKind::HorizontalRule:
                break;
            }
            return "\xE2\x94\x80";
        }

    } // namespace

    DecoratedEditor::DecoratedEditor(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll,
                                     TIndicator *indicator, TStringView fileName,
                                     const sn::markdown::EngineSettings &settings) noexcept
        : TFileEditor(bounds, hScroll, vScroll, indicator, fileName), engine(*this, settings)
    {
        engine.recompute();
    }

    std::string DecoratedEditor::readRange(uint start, uint end) const
    {
        std::string result;
        end = std::min(end, bufLen);
        if (start >= end)
            return result;
        result.reserve(end - start);
        for (uint i = start; i < end; ++i)
            result.push_back(buffer[i < curPtr ? i : i + gapLen]);
        return result;
    }

    std::string DecoratedEditor::currentText() const
    {
        return readRange(0, bufLen);
    }

    TextRange DecoratedEditor::currentSelection() const
    {
        if (selStart == selEnd)
            return TextRange{curPtr, curPtr};
        return TextRange{selStart, selEnd};
    }

    void DecoratedEditor::replaceRange(TextRange range, std::string_view text)
    {
        uint start = static_cast<uint>(std::min<std::size_t>(range.start, bufLen));
        uint end = static_cast<uint>(std::min<std::size_t>(range.end, bufLen));
        lock();
        if (end > start)
            deleteRange(start, end, False);
        setCurPtr(start, 0);
        if (!text.empty())
            insertText(text.data(), static_cast<uint>(text.size()), False);
        unlock();
    }

    void DecoratedEditor::setSelection(TextRange range)
    {
        uint start = static_cast<uint>(std::min<std::size_t>(range.start, bufLen));
        uint end = static_cast<uint>(std::min<std::size_t>(range.end, bufLen));
        lock();
        setSelect(start, end, False);
        trackCursor(False);
        unlock();
    }

    void DecoratedEditor::applyDecorations(const sn::markdown::DecorationList &list)
    {
        decorations = list;
        drawView();
    }

    // Keeps the last pass roughly aligned with the text until the debounced
    // recompute replaces it.
    void DecoratedEditor::shiftDecorations(std::size_t position, long delta)
    {
        auto move = [&](std::size_t offset) {
            if (offset < position)
                return offset;
            long moved = static_cast<long>(offset) + delta;
            return static_cast<std::size_t>(std::max<long>(moved, static_cast<long>(position)));
        };
        for (auto &decoration : decorations)
        {
            decoration.range.start = move(decoration.range.start);
            decoration.range.end = std::max(decoration.range.start, move(decoration.range.end));
        }
    }

    void DecoratedEditor::pollEngine(std::chrono::steady_clock::time_point now)
    {
        engine.poll(now);
    }

    void DecoratedEditor::toggleTaskOnCursorLine()
    {
        std::string text = currentText();
        std::vector<sn::markdown::Line> lines = sn::markdown::splitLines(text);
        auto index = sn::markdown::lineIndexAt(lines, curPtr);
        if (!index)
            return;
        const auto &line = lines[*index];
        auto classification = sn::markdown::classifyLine(sn::markdown::lineText(text, line));
        if (!std::holds_alternative<sn::markdown::ChecklistItem>(classification.kind))
            return;
        engine.toggleCheckbox(classification.checkboxRange.shifted(line.range.start));
    }

    void DecoratedEditor::toggleSmartListContinuation()
    {
        auto settings = engine.settings();
        settings.smartListContinuation = !settings.smartListContinuation;
        engine.setSettings(settings);
    }

    void DecoratedEditor::toggleRevealSyntax()
    {
        auto settings = engine.settings();
        settings.revealActiveLine = !settings.revealActiveLine;
        engine.setSettings(settings);
    }

    CursorStatus DecoratedEditor::cursorStatus() const
    {
        CursorStatus status;
        status.hasEditor = true;
        status.isModified = modified;

        std::string text = currentText();
        auto structure = sn::markdown::analyzeDocument(text);
        auto index = sn::markdown::lineIndexAt(structure.lines, curPtr);
        if (!index)
            return status;

        const auto &line = structure.lines[*index];
        const auto &classification = structure.classifications[*index];
        status.lineNumber = line.number;
        status.blockType = sn::markdown::blockTypeName(classification.kind);

        if (sn::markdown::isCodeFence(classification.kind) || sn::markdown::isTableLine(classification.kind))
            return status;
        std::size_t contentStart = line.range.start + classification.contentStart;
        if (curPtr < contentStart || curPtr > line.range.end)
            return status;
        std::string_view content = sn::markdown::lineText(text, line).substr(classification.contentStart);
        auto spans = sn::markdown::scanInline(content);
        if (const auto *span = sn::markdown::spanAtOffset(spans, curPtr - contentStart))
            status.spanKind = sn::markdown::spanKindName(span->kind);
        return status;
    }

    bool DecoratedEditor::handleEngineKey(TEvent &event)
    {
        if (event.what != evKeyDown)
            return false;

        sn::markdown::EditCommand command;
        switch (event.keyDown.keyCode)
        {
        case kbEnter:
            command = sn::markdown::EditCommand::Enter;
            break;
        case kbTab:
            command = sn::markdown::EditCommand::Tab;
            break;
        case kbShiftTab:
            command = sn::markdown::EditCommand::ShiftTab;
            break;
        default:
            return false;
        }

        if (!engine.handleCommand(command))
            return false;
        clearEvent(event);
        return true;
    }

    bool DecoratedEditor::handleWidgetClick(TEvent &event)
    {
        if (event.what != evMouseDown || (event.mouse.buttons & mbLeftButton) == 0)
            return false;

        if (engine.recomputePending())
            engine.recompute();

        TPoint local = makeLocal(event.mouse.where);
        if (local.y < 0 || local.y >= static_cast<int>(rowLayouts.size()))
            return false;

        for (const auto &cell : rowLayouts[static_cast<std::size_t>(local.y)].widgets)
        {
            if (local.x < cell.firstColumn || local.x >= cell.lastColumn)
                continue;
            auto toggleRange = engine.hitTestWidget(cell.offset);
            if (!toggleRange || !engine.toggleCheckbox(*toggleRange))
                return false;
            clearEvent(event);
            return true;
        }
        return false;
    }

    void DecoratedEditor::handleEvent(TEvent &event)
    {
        if (handleEngineKey(event) || handleWidgetClick(event))
            return;

        if (event.what == evCommand && event.message.command == cmToggleTaskCheckbox)
        {
            toggleTaskOnCursorLine();
            clearEvent(event);
            return;
        }

        uint prevInsCount = insCount;
        uint prevDelCount = delCount;
        uint prevBufLen = bufLen;
        uint prevCurPtr = curPtr;
        Boolean prevModified = modified;
        TextRange prevSelection = currentSelection();

        TFileEditor::handleEvent(event);

        bool contentChanged = insCount != prevInsCount || delCount != prevDelCount || bufLen != prevBufLen ||
                              modified != prevModified;
        auto now = std::chrono::steady_clock::now();
        if (contentChanged)
        {
            auto mode = engine.onTextChanged(currentText(), now);
            if (mode == sn::markdown::RecomputeMode::Debounced)
            {
                shiftDecorations(std::min(prevCurPtr, curPtr),
                                 static_cast<long>(bufLen) - static_cast<long>(prevBufLen));
                drawView();
            }
        }
        else if (currentSelection() != prevSelection)
        {
            engine.onSelectionChanged(currentSelection());
        }
    }

    uint DecoratedEditor::topLinePointer()
    {
        int diff = curPos.y - delta.y;
        uint pointer = curPtr;
        if (diff != 0)
            pointer = lineMove(pointer, -diff);
        return lineStart(pointer);
    }

    int DecoratedEditor::drawDecoratedLine(int row, uint linePtr, TAttrPair colors, int &cursorColumn)
    {
        uint endPtr = lineEnd(linePtr);
        std::string line = readRange(linePtr, endPtr);
        std::size_t length = line.size();

        TColorAttr base = colors[0];
        std::vector<TColorAttr> attrs;
        std::vector<bool> hidden(length, false);
        std::vector<const Decoration *> widgets(length, nullptr);
        std::vector<const Decoration *> marks;

        auto first = std::lower_bound(decorations.begin(), decorations.end(), linePtr,
                                      [](const Decoration &d, uint offset) { return d.range.start < offset; });
        for (auto it = first; it != decorations.end() && it->range.start < endPtr; ++it)
        {
            const Decoration &decoration = *it;
            std::size_t start = decoration.range.start - linePtr;
            std::size_t end = std::min<std::size_t>(decoration.range.end - linePtr, length);
            if (const auto *style = std::get_if<sn::markdown::LineStyle>(&decoration.action))
                applyStyle(base, style->style);
            else if (std::holds_alternative<sn::markdown::Hide>(decoration.action))
                std::fill(hidden.begin() + static_cast<long>(start), hidden.begin() + static_cast<long>(end), true);
            else if (std::holds_alternative<sn::markdown::ReplaceWithWidget>(decoration.action))
                widgets[start] = &decoration;
            else
                marks.push_back(&decoration);
        }

        attrs.assign(length, base);
        for (const Decoration *mark : marks)
        {
            std::size_t start = mark->range.start - linePtr;
            std::size_t end = std::min<std::size_t>(mark->range.end - linePtr, length);
            StyleTag tag = std::get<sn::markdown::Mark>(mark->action).style;
            for (std::size_t i = start; i < end; ++i)
                applyStyle(attrs[i], tag);
        }

        TDrawBuffer buffer;
        buffer.moveChar(0, ' ', base, size.x);
        RowLayout &layout = rowLayouts[static_cast<std::size_t>(row)];
        layout.linePtr = linePtr;

        int column = 0;
        auto put = [&](std::string_view glyph, TColorAttr attr) {
            int width = std::max(1, strwidth(glyph));
            int screen = column - delta.x;
            if (screen >= 0 && screen < size.x)
                buffer.moveStr(static_cast<ushort>(screen), glyph, attr);
            column += width;
        };

        std::size_t i = 0;
        while (i < length)
        {
            uint offset = linePtr + static_cast<uint>(i);
            if (offset == curPtr)
                cursorColumn = column;

            if (const Decoration *widgetDecoration = widgets[i])
            {
                const auto &widget = std::get<sn::markdown::ReplaceWithWidget>(widgetDecoration->action);
                int startColumn = column - delta.x;
                if (widget.widget == WidgetKind::HorizontalRule)
                {
                    while (column - delta.x < size.x)
                        put(widgetGlyph(widget), attrs[i]);
                }
                else
                {
                    TColorAttr attr = attrs[i];
                    applyStyle(attr, StyleTag::ListMarker);
                    put(widgetGlyph(widget), attr);
                }
                layout.widgets.push_back(WidgetCell{startColumn, column - delta.x, offset});
                std::size_t skipTo = std::min<std::size_t>(widgetDecoration->range.end - linePtr, length);
                if (curPtr > offset && curPtr < linePtr + skipTo)
                    cursorColumn = column;
                i = skipTo;
                continue;
            }

            if (hidden[i])
            {
                ++i;
                continue;
            }

            bool selected = offset >= selStart && offset < selEnd;
            TColorAttr attr = selected ? colors[1] : attrs[i];
            if (line[i] == '\t')
            {
                int spaces = kTabWidth - (column % kTabWidth);
                for (int s = 0; s < spaces; ++s)
                    put(" ", attr);
                ++i;
                continue;
            }

            std::size_t count = std::min(utf8Length(static_cast<unsigned char>(line[i])), length - i);
            put(std::string_view(line).substr(i, count), attr);
            i += count;
        }
        if (curPtr == endPtr)
            cursorColumn = column;

        writeLine(0, row, size.x, 1, buffer);
        return column;
    }

    void DecoratedEditor::draw()
    {
        TAttrPair colors = getColor(0x0201);
        rowLayouts.assign(static_cast<std::size_t>(std::max(0, static_cast<int>(size.y))), RowLayout{});

        uint linePtr = topLinePointer();
        uint cursorLine = lineStart(curPtr);
        bool pastEnd = false;
        int cursorRow = -1;
        int cursorColumn = -1;

        for (int row = 0; row < size.y; ++row)
        {
            if (pastEnd)
            {
                TDrawBuffer blank;
                blank.moveChar(0, ' ', colors[0], size.x);
                writeLine(0, row, size.x, 1, blank);
                continue;
            }

            int column = -1;
            drawDecoratedLine(row, linePtr, colors, column);
            if (linePtr == cursorLine)
            {
                cursorRow = row;
                cursorColumn = column;
            }
            if (lineEnd(linePtr) >= bufLen)
                pastEnd = true;
            else
                linePtr = nextLine(linePtr);
        }

        if (cursorRow >= 0 && cursorColumn >= 0)
            setCursor(cursorColumn - delta.x, cursorRow);
    }

} // namespace sn::edit
