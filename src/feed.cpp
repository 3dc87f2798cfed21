#include <algorithm>
#include <cstdio>
#include <format>

#define NOMINMAX
#include "curl/curl.h"

#include <RUtils/Defer.hpp>
#include <RUtils/Error.hpp>

#include "site.hpp"
#include "helpers.hpp"
#include "errors.hpp"



mdsite::FeedEntry mdsite::make_feed_entry(const SiteConfig &config, const std::filesystem::path &target, const Document &document) {
    FeedEntry entry;
    entry.title = document.metadata.title;
    entry.href = to_href(target);
    entry.link = absolute_link(config.base_url, entry.href);
    entry.description = document.metadata.description;
    entry.tags = document.metadata.tags;
    entry.published = document.metadata.ctime.value_or(document.modified);
    entry.updated = document.metadata.mtime.value_or(entry.published);
    return entry;
}


void mdsite::sort_feed_entries(std::vector<FeedEntry> &entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const FeedEntry& a, const FeedEntry& b) {
        if(a.published != b.published) {
            return a.published > b.published;
        }
        if(a.title != b.title) {
            return a.title < b.title;
        }
        return a.link < b.link;
    });
}


std::string mdsite::absolute_link(const std::string &base_url, const std::string &href) {
    std::string base = base_url;
    if(base.empty() || base.back() != '/') {
        base += '/';
    }

    CURLU* url_handle = curl_url();
    RUtils::Defer( curl_url_cleanup(url_handle); );

    if (CURLUcode err = curl_url_set(url_handle, CURLUPART_URL, base.c_str(), CURLU_DEFAULT_SCHEME); err != CURLUE_OK) {
        RUtils::Error(std::format("Failed to parse base url: \"{}\": {}.", base, curl_url_strerror(err)), RUtils::ErrorType::library).print();
        return base + href;
    }

    // A relative url is resolved against the one already set
    if (CURLUcode err = href.empty() ? CURLUE_OK : curl_url_set(url_handle, CURLUPART_URL, href.c_str(), CURLU_ALLOW_SPACE); err != CURLUE_OK) {
        RUtils::Error(std::format("Failed to resolve link: \"{}\": {}.", href, curl_url_strerror(err)), RUtils::ErrorType::library).print();
        return base + href;
    }

    char* url = nullptr;
    if (CURLUcode err = curl_url_get(url_handle, CURLUPART_URL, &url, 0); err != CURLUE_OK) {
        RUtils::Error(curl_url_strerror(err), RUtils::ErrorType::library).print();
        return base + href;
    }
    RUtils::Defer( curl_free(url); );

    return url;
}



namespace {
    // Sorted and cut to the item limit. Throws empty_feed naming feed_file.
    void prepare_feed_entries(const mdsite::SiteConfig &config, std::vector<mdsite::FeedEntry> &entries, const std::string &feed_file) {
        if(entries.empty() && config.require_feed_entries) {
            throw mdsite::BuildError(mdsite::ErrorKind::empty_feed, "No documents to list in the feed.", config.output_dir / feed_file);
        }

        mdsite::sort_feed_entries(entries);
        if(entries.size() > config.feed_item_limit) {
            entries.resize(config.feed_item_limit);
        }
    }
}



std::string mdsite::build_feed(const SiteConfig &config, std::vector<FeedEntry> entries) {
    prepare_feed_entries(config, entries, config.feed_file);

    std::string site_link = absolute_link(config.base_url, "");
    std::string feed_link = absolute_link(config.base_url, config.feed_file);

    std::string out;
    out += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out += "<rss version=\"2.0\" xmlns:atom=\"http://www.w3.org/2005/Atom\">\n";
    out += "<channel>\n";
    out += std::format("<title>{}</title>\n", escape_html(config.title));
    out += std::format("<link>{}</link>\n", escape_html(site_link));
    out += std::format("<description>{}</description>\n", escape_html(config.description));
    out += std::format("<atom:link href=\"{}\" rel=\"self\" type=\"application/rss+xml\"/>\n", escape_html(feed_link));
    out += "<generator>mdsite</generator>\n";

    // Newest entry, not the wall clock, keeps rebuilds identical
    if(!entries.empty()) {
        out += std::format("<lastBuildDate>{}</lastBuildDate>\n", to_rfc2822(entries.front().published));
    }

    for (auto& entry : entries) {
        out += "<item>\n";
        out += std::format("<title>{}</title>\n", escape_html(entry.title));
        out += std::format("<link>{}</link>\n", escape_html(entry.link));
        out += std::format("<guid isPermaLink=\"true\">{}</guid>\n", escape_html(entry.link));
        if(entry.description) {
            out += std::format("<description>{}</description>\n", escape_html(*entry.description));
        }
        out += std::format("<pubDate>{}</pubDate>\n", to_rfc2822(entry.published));
        for (auto& tag : entry.tags) {
            out += std::format("<category>{}</category>\n", escape_html(tag));
        }
        out += "</item>\n";
    }

    out += "</channel>\n</rss>\n";
    return out;
}


std::string mdsite::build_atom_feed(const SiteConfig &config, std::vector<FeedEntry> entries) {
    prepare_feed_entries(config, entries, config.atom_file);

    std::string site_link = absolute_link(config.base_url, "");
    std::string feed_link = absolute_link(config.base_url, config.atom_file);

    // Latest update among the listed entries, the epoch for an empty feed
    Date updated = Date{std::chrono::sys_days{}};
    for (auto& entry : entries) {
        updated = std::max(updated, entry.updated);
    }

    std::string out;
    out += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out += "<feed xmlns=\"http://www.w3.org/2005/Atom\">\n";
    out += std::format("<title>{}</title>\n", escape_html(config.title));
    if(!config.description.empty()) {
        out += std::format("<subtitle>{}</subtitle>\n", escape_html(config.description));
    }
    out += std::format("<id>{}</id>\n", escape_html(site_link));
    out += std::format("<updated>{}</updated>\n", to_rfc3339(updated));
    out += std::format("<link href=\"{}\"/>\n", escape_html(site_link));
    out += std::format("<link href=\"{}\" rel=\"self\" type=\"application/atom+xml\"/>\n", escape_html(feed_link));
    if(!config.author.empty()) {
        out += std::format("<author><name>{}</name></author>\n", escape_html(config.author));
    }
    out += "<generator>mdsite</generator>\n";

    for (auto& entry : entries) {
        out += "<entry>\n";
        out += std::format("<id>{}</id>\n", escape_html(entry.link));
        out += std::format("<title>{}</title>\n", escape_html(entry.title));
        out += std::format("<published>{}</published>\n", to_rfc3339(entry.published));
        out += std::format("<updated>{}</updated>\n", to_rfc3339(entry.updated));
        out += std::format("<link href=\"{}\"/>\n", escape_html(entry.link));
        if(entry.description) {
            out += std::format("<content type=\"html\">{}</content>\n", escape_html(*entry.description));
        }
        for (auto& tag : entry.tags) {
            out += std::format("<category term=\"{}\"/>\n", escape_html(tag));
        }
        out += "</entry>\n";
    }

    out += "</feed>\n";
    return out;
}


void mdsite::write_feed(const SiteConfig &config, const std::vector<FeedEntry> &entries) {
    write_text_file(config.output_dir / config.feed_file, build_feed(config, entries));
    write_text_file(config.output_dir / config.atom_file, build_atom_feed(config, entries));
}
