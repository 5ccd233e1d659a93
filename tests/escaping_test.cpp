#include <erlflow/escaping.h>

#include <gtest/gtest.h>

namespace {

TEST(EscapingTest, EscapesQuotesBackslashesAndControls) {
  const std::string input = "say \"hi\"\twith\ncontrols\\";
  const std::string escaped = erlflow::EscapeJsonString(input);

  EXPECT_EQ("say \\\"hi\\\"\\twith\\ncontrols\\\\", escaped);
}

TEST(EscapingTest, EscapesRemainingControlCharactersAsUnicode) {
  const std::string input{'a', '\x01', 'b', '\x1f'};

  EXPECT_EQ("a\\u0001b\\u001f", erlflow::EscapeJsonString(input));
}

TEST(EscapingTest, LeavesUtf8BytesUntouched) {
  const std::string input = "caf\xc3\xa9";

  EXPECT_EQ(input, erlflow::EscapeJsonString(input));
}

TEST(EscapingTest, RendersStringArrays) {
  EXPECT_EQ("[]", erlflow::JsonStringArray({}));
  EXPECT_EQ("[\"max\",\"(\",\"\\\"s\\\"\"]",
            erlflow::JsonStringArray({"max", "(", "\"s\""}));
}

} // namespace
