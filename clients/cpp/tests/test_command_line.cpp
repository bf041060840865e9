#include "minitest.hpp"
#include "command_line.hpp"

using namespace lsquota;

TEST(command_line_joins_arguments_with_spaces) {
  ASSERT_EQ(join_arguments({"/bin/ls", "-l", "/tmp"}), std::string("/bin/ls -l /tmp"));
  ASSERT_EQ(join_arguments({}), std::string());
}

TEST(command_line_matches_name_and_port_flag) {
  std::string cmd = "/opt/ag/language_server_linux_x64 --extension_server_port=4000 --csrf_token=abc";
  ASSERT_TRUE(is_language_server(searchable_text("language_server", cmd), "language_server_linux"));
  // name alone is not enough
  ASSERT_FALSE(is_language_server(searchable_text("language_server", "/opt/ag/language_server_linux_x64 --csrf_token=abc"),
                                  "language_server_linux"));
  // flag alone is not enough
  ASSERT_FALSE(is_language_server(searchable_text("node", "node server.js --extension_server_port=4000"),
                                  "language_server_linux"));
  // other platform binary
  ASSERT_FALSE(is_language_server(searchable_text("language_server_macos", "language_server_macos --extension_server_port 1"),
                                  "language_server_linux"));
}

TEST(command_line_matches_on_process_name) {
  ASSERT_TRUE(is_language_server(searchable_text("language_server_linux", "./ls --extension_server_port 9"),
                                 "language_server_linux"));
}

TEST(command_line_extracts_token_with_equals_or_space) {
  ASSERT_EQ(*extract_csrf_token("x --csrf_token=ab-12-CD y"), std::string("ab-12-CD"));
  ASSERT_EQ(*extract_csrf_token("x --csrf_token   f00d-beef"), std::string("f00d-beef"));
}

TEST(command_line_token_stops_at_disallowed_characters) {
  ASSERT_EQ(*extract_csrf_token("--csrf_token=abc_def"), std::string("abc"));
}

TEST(command_line_first_token_wins) {
  ASSERT_EQ(*extract_csrf_token("--csrf_token=first --csrf_token=second"), std::string("first"));
}

TEST(command_line_missing_token_is_none) {
  ASSERT_FALSE(extract_csrf_token("--extension_server_port=1234").has_value());
  ASSERT_FALSE(extract_csrf_token("--csrf_token=").has_value());
  ASSERT_FALSE(extract_csrf_token("--csrf_tokenabc").has_value());
}

TEST(command_line_extracts_extension_port) {
  ASSERT_EQ(extract_extension_port("--extension_server_port=41234"), 41234);
  ASSERT_EQ(extract_extension_port("--extension_server_port 5"), 5);
  ASSERT_EQ(extract_extension_port("--extension_server_port=1 --extension_server_port=2"), 1);
}

TEST(command_line_extension_port_defaults_to_zero) {
  ASSERT_EQ(extract_extension_port("--csrf_token=abc"), 0);
  ASSERT_EQ(extract_extension_port("--extension_server_port=abc"), 0);
  ASSERT_EQ(extract_extension_port("--extension_server_port=99999999999999"), 0);
}
