#include "Scratch.hpp"
#include "log/TaggedLogger.hpp"
#include "type/ValueJson.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using SS::Scratch;
using SS::Sequence;
using SS::Value;

namespace {

struct Page {
    std::string title;
    std::string section;
    int         wordCount;
    std::vector<std::string> tags;
};

struct RenderedPage {
    std::string title;
    std::string summary;
};

// Renders one page against its own scratch while contributing to the shared site scratch.
auto renderPage(Page const& page, Scratch& site) -> RenderedPage {
#ifdef SS_LOG_DEBUG
    SS::set_thread_name("render:" + page.title);
#endif
    Scratch pageScratch;
    pageScratch.set("heading", page.title);
    for (auto const& tag : page.tags) {
        if (auto error = pageScratch.add("tagList", Sequence{tag}))
            std::cerr << "tag accumulation failed: " << SS::describeError(*error) << '\n';
    }
    if (auto error = pageScratch.add("heading", " (" + page.section + ")"))
        std::cerr << "heading accumulation failed: " << SS::describeError(*error) << '\n';

    if (auto error = site.add("totalWords", page.wordCount))
        std::cerr << "word count failed: " << SS::describeError(*error) << '\n';
    if (auto error = site.add("pageCount", 1))
        std::cerr << "page count failed: " << SS::describeError(*error) << '\n';
    if (auto error = site.setInMap("sections", page.section + "/" + page.title, page.title))
        std::cerr << "section index failed: " << SS::describeError(*error) << '\n';

    RenderedPage rendered{page.title, {}};
    if (auto heading = pageScratch.get("heading"); heading && heading->asText())
        rendered.summary = *heading->asText();
    if (auto tags = pageScratch.get("tagList"))
        rendered.summary += " tags=" + SS::describeValue(*tags);
    ss_log("rendered " + page.title, "Example");
    return rendered;
}

} // namespace

int main() {
#ifdef SS_LOG_DEBUG
    SS::set_thread_name("main");
#endif
    std::vector<Page> const pages{
            {"intro", "docs", 420, {"start", "overview"}},
            {"install", "docs", 810, {"setup"}},
            {"release-notes", "blog", 1200, {"news", "release"}},
            {"roadmap", "blog", 300, {}},
    };

    auto site = SS::makeScratch();
    site->set("totalWords", 0);

    std::vector<RenderedPage> rendered(pages.size());
    std::vector<std::thread>  workers;
    workers.reserve(pages.size());
    for (std::size_t i = 0; i < pages.size(); ++i)
        workers.emplace_back([&, i] { rendered[i] = renderPage(pages[i], *site); });
    for (auto& worker : workers)
        worker.join();

    for (auto const& page : rendered)
        std::cout << page.title << ": " << page.summary << '\n';

    if (auto words = site->get("totalWords"))
        std::cout << "total words: " << SS::describeValue(*words) << '\n';
    if (auto count = site->get("pageCount"))
        std::cout << "pages: " << SS::describeValue(*count) << '\n';

    auto index = site->getSortedMapValues("sections");
    if (!index) {
        std::cerr << "section index unavailable: " << SS::describeError(index.error()) << '\n';
        return EXIT_FAILURE;
    }
    if (*index)
        std::cout << "sections: " << SS::describeValue(Value{**index}) << '\n';
    return EXIT_SUCCESS;
}
