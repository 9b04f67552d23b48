#include <gtest/gtest.h>
#include "stencil/chat/chat_template.hpp"
#include "stencil/engine/renderer.hpp"
#include "fixtures/template_expectations.hpp"
#include "mocks/mock_tag_scanner.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace stencil;
using namespace stencil::testing;
using namespace stencil::testing::fixtures;

class ConcurrencyTest : public ::testing::Test {
protected:
    static constexpr int kThreads = 8;
    static constexpr int kIterations = 200;
};

TEST_F(ConcurrencyTest, SharedTemplateRendersIndependently) {
    auto tmpl = parse("Hello, {name}! You are #{rank:03d}.");
    ASSERT_TRUE(tmpl.has_value());

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kIterations; ++i) {
                auto name = "user" + std::to_string(t);
                auto result = render(*tmpl, {{"name", name}, {"rank", i}});
                auto rank = std::to_string(i);
                rank.insert(0, 3 - rank.size(), '0');
                auto expected = "Hello, " + name + "! You are #" + rank + ".";
                if (!result || *result != expected) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(failures.load(), 0);
}

TEST_F(ConcurrencyTest, SharedMustacheTemplateWithSections) {
    auto tmpl = parse(TemplateExpectations::mustache_report_source());
    ASSERT_TRUE(tmpl.has_value());
    const auto context = TemplateExpectations::mustache_report_context();
    const auto expected = TemplateExpectations::mustache_report_output();

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kIterations; ++i) {
                auto result = render(*tmpl, context);
                if (!result || *result != expected) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(failures.load(), 0);
}

TEST_F(ConcurrencyTest, LenientMissesStayPerRender) {
    auto tmpl = parse("{a}{b}");
    ASSERT_TRUE(tmpl.has_value());

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            Context context = (t % 2 == 0) ? Context{{"a", "x"}} : Context{{"b", "y"}};
            std::vector<std::string> expected_missing{(t % 2 == 0) ? "b" : "a"};
            for (int i = 0; i < kIterations; ++i) {
                auto result = render_detailed(*tmpl, context, RenderOptions::lenient());
                if (!result || result->missing_variables != expected_missing) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(failures.load(), 0);
}

TEST_F(ConcurrencyTest, ConcurrentParsesAreEqual) {
    const std::string source = "{{#items}}{{title}}: {{{note}}}\n{{/items}}";
    auto reference = parse(source);
    ASSERT_TRUE(reference.has_value());

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kIterations; ++i) {
                auto parsed = parse(source);
                if (!parsed || *parsed != *reference) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(failures.load(), 0);
}

TEST_F(ConcurrencyTest, SharedChatTemplate) {
    auto conversation = chat::ChatTemplate::from_messages({
        {Role::System, "You are {persona}."},
        {Role::User, "{question}"}
    });
    ASSERT_TRUE(conversation.has_value());

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            auto question = "q" + std::to_string(t);
            for (int i = 0; i < kIterations; ++i) {
                auto messages = conversation->format_messages({{"persona", "p"}, {"question", question}});
                if (!messages || messages->size() != 2 || (*messages)[1].content != question) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(failures.load(), 0);
}

TEST_F(ConcurrencyTest, SharedScannerTracksConcurrentScans) {
    MockTagScanner scanner;
    const std::vector<std::string> sources = {"{{a}}", "{{#b}}x{{/b}}"};

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            const auto& source = sources[t % sources.size()];
            for (int i = 0; i < kIterations; ++i) {
                auto tmpl = parse(source, scanner);
                if (!tmpl || tmpl->to_source() != source) {
                    ++failures;
                }
                auto last = scanner.last_source();
                if (last != sources[0] && last != sources[1]) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(scanner.scan_calls.load(), kThreads * kIterations);
}
