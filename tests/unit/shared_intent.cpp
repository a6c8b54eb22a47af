#include <array>
#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "clipferry/crypto.hpp"
#include "clipferry/error_codes.hpp"
#include "clipferry/intent.hpp"

using namespace clipferry;

void run_engine_component_tests();
void run_conversation_engine_tests();
void run_bot_component_tests();

namespace
{

    void test_plain_text_is_reference()
    {
        const auto intent = parse_intent("  https://video.example/watch?v=abc \n");
        assert(intent.kind == IntentKind::Text);
        assert(intent.argument == "https://video.example/watch?v=abc");
    }

    void test_known_commands()
    {
        assert(parse_intent("/start").kind == IntentKind::Start);
        assert(parse_intent("/video").kind == IntentKind::SelectVideo);
        assert(parse_intent("/audio").kind == IntentKind::SelectAudio);
        assert(parse_intent("/cancel").kind == IntentKind::Cancel);
        assert(parse_intent("/start@clipferry_bot").kind == IntentKind::Start);
        assert(parse_intent("/cancel now please").kind == IntentKind::Cancel);
    }

    void test_resolution_selector()
    {
        const auto plain = parse_intent("/res_720p");
        assert(plain.kind == IntentKind::SelectResolution);
        assert(plain.argument == "720p");

        const auto addressed = parse_intent("/res_1080p@clipferry_bot");
        assert(addressed.kind == IntentKind::SelectResolution);
        assert(addressed.argument == "1080p");

        const auto nested = parse_intent("/res_hd_480p");
        assert(nested.argument == "480p");

        const auto empty = parse_intent("/res_");
        assert(empty.kind == IntentKind::SelectResolution);
        assert(empty.argument.empty());
    }

    void test_unknown_command()
    {
        const auto intent = parse_intent("/help");
        assert(intent.kind == IntentKind::Unknown);
        assert(intent.argument == "help");
        assert(!intent_kind_from_command("res_720p").has_value());
        assert(to_string(IntentKind::SelectResolution) == "SELECT_RESOLUTION");
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::SizeLimitExceeded) == "size_limit_exceeded");
        assert(to_int(ErrorCode::DeliveryError) == 8);

        Result<int> good = 42;
        assert(good.ok());
        assert(good.value() == 42);
        assert(good.code() == ErrorCode::Ok);

        Result<int> bad = make_failure(ErrorCode::DownloadError, "timeout");
        assert(!bad);
        assert(bad.code() == ErrorCode::DownloadError);
        assert(bad.failure().message == "timeout");

        const Status status = ok_status();
        assert(status.ok());
    }

    void test_naming_tokens()
    {
        const auto first = crypto::identity_token("12345");
        assert(first.size() == 32);
        assert(first == crypto::identity_token("12345"));
        assert(first != crypto::identity_token("12346"));
        assert(first.find_first_not_of("0123456789abcdef") == std::string::npos);

        std::set<std::string> tokens;
        for (int i = 0; i < 32; ++i)
        {
            const auto token = crypto::random_token();
            assert(token.size() == 16);
            tokens.insert(token);
        }
        assert(tokens.size() == 32);

        const std::array<unsigned char, 3> bytes = {0x00, 0xAB, 0xFF};
        assert(crypto::to_hex(bytes) == "00abff");
    }

} // namespace

int main()
{
    try
    {
        test_plain_text_is_reference();
        test_known_commands();
        test_resolution_selector();
        test_unknown_command();
        test_error_codes();
        test_naming_tokens();
        run_engine_component_tests();
        run_conversation_engine_tests();
        run_bot_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
