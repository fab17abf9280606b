#include "injection_scripts.h"

#include <gtest/gtest.h>

#include <cstddef>

TEST(InjectionScriptsTest, ClickScriptCarriesCoordinates)
{
    std::string script = injection::buildClickScript(120, -4);
    EXPECT_NE(script.find("const x = 120;"), std::string::npos);
    EXPECT_NE(script.find("const y = -4;"), std::string::npos);
    EXPECT_NE(script.find("elementFromPoint(x, y)"), std::string::npos);
    EXPECT_NE(script.find("clickTarget.click()"), std::string::npos);
}

TEST(InjectionScriptsTest, ClickScriptTogglesVideoPlayback)
{
    std::string script = injection::buildClickScript(300, 200);
    std::size_t player = script.find("el.tagName === 'VIDEO'");
    ASSERT_NE(player, std::string::npos);
    EXPECT_NE(script.find("el.closest('#movie_player')"), std::string::npos);
    EXPECT_NE(script.find("video.play()"), std::string::npos);
    EXPECT_NE(script.find("video.pause()"), std::string::npos);

    // Playback is handled before any synthetic click is dispatched
    EXPECT_LT(player, script.find("new MouseEvent('click'"));
}

TEST(InjectionScriptsTest, TextEntryOnlySubmitsWhenAsked)
{
    std::string plain = injection::buildTextEntryScript("hello", false);
    EXPECT_NE(plain.find("const value = \"hello\";"), std::string::npos);
    EXPECT_EQ(plain.find("KeyboardEvent"), std::string::npos);
    EXPECT_EQ(plain.find("submitBtn"), std::string::npos);

    std::string submitting = injection::buildTextEntryScript("hello", true);
    EXPECT_NE(submitting.find("key: 'Enter'"), std::string::npos);
    EXPECT_NE(submitting.find("submitBtn.click()"), std::string::npos);
    EXPECT_EQ(submitting.find("new Event('submit'"), std::string::npos);
    EXPECT_LT(submitting.find("key: 'Enter'"), submitting.find("submitBtn.click()"));
}

TEST(InjectionScriptsTest, TextEntryOnlyTargetsEditableElements)
{
    for (bool submit : {false, true})
    {
        std::string script = injection::buildTextEntryScript("hello", submit);
        std::size_t guard = script.find(
            "if (!el || !(el.tagName === 'INPUT' || el.tagName === 'TEXTAREA' || el.isContentEditable)) return;");
        ASSERT_NE(guard, std::string::npos);
        EXPECT_LT(guard, script.find("el.value = value;"));
        EXPECT_EQ(script.find("document.body"), std::string::npos);
    }
}

TEST(InjectionScriptsTest, StringLiteralEscapesBreakouts)
{
    EXPECT_EQ(injection::jsStringLiteral("say \"hi\""), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(injection::jsStringLiteral("a\\b"), "\"a\\\\b\"");
    EXPECT_EQ(injection::jsStringLiteral("line\nnext"), "\"line\\nnext\"");
    EXPECT_EQ(injection::jsStringLiteral("</script>"), "\"\\x3c/script>\"");
    EXPECT_EQ(injection::jsStringLiteral(std::string("\x01", 1)), "\"\\u0001\"");
    EXPECT_EQ(injection::jsStringLiteral("caf\xC3\xA9"), "\"caf\xC3\xA9\"");
}
