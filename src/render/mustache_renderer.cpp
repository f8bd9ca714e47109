#include "fastx_scanner/mustache_renderer.hpp"
#include "fastx_scanner/path_utils.hpp"

#include <kainjow/mustache.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fx {

namespace fs = std::filesystem;

void TemplateContext::set(std::string key, std::string value) {
  for (auto& kv : values) {
    if (kv.first == key) { kv.second = std::move(value); return; }
  }
  values.emplace_back(std::move(key), std::move(value));
}

void TemplateContext::declare_list(const std::string& list) {
  for (auto& l : lists) if (l.first == list) return;
  lists.emplace_back(list, std::vector<Item>{});
}

void TemplateContext::add_item(const std::string& list, Item item) {
  declare_list(list);
  for (auto& l : lists) {
    if (l.first == list) { l.second.push_back(std::move(item)); return; }
  }
}

MustacheRenderer::MustacheRenderer() : cfg_{} {}

MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

namespace {

bool read_text(const fs::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// Partials are spliced into the template text before parsing, so they see
// the context of the section they appear in. Partials are not expanded
// recursively.
bool expand_partials(std::string_view tpl, const fs::path& dir, std::string& out, std::string& err) {
  out.clear();
  out.reserve(tpl.size());
  std::size_t at = 0;
  for (;;) {
    const std::size_t open = tpl.find("{{>", at);
    if (open == std::string_view::npos) break;
    const std::size_t close = tpl.find("}}", open + 3);
    if (close == std::string_view::npos) break;

    const std::string name(trim(tpl.substr(open + 3, close - open - 3)));
    out.append(tpl.substr(at, open - at));
    at = close + 2;
    if (name.empty()) continue;

    std::string body;
    if (!read_text(dir / (name + ".mustache"), body) && !read_text(dir / name, body)) {
      err = "partial '" + name + "' not found in " + dir.string();
      return false;
    }
    out += body;
  }
  out.append(tpl.substr(at));
  return true;
}

kainjow::mustache::data item_data(const TemplateContext::Item& item) {
  kainjow::mustache::data d;
  for (const auto& kv : item) d.set(kv.first, kv.second);
  return d;
}

}

bool MustacheRenderer::render_string(std::string_view tpl_text, const TemplateContext& ctx,
                                     std::string& out) {
  err_.clear();
  std::string tpl;
  if (!expand_partials(tpl_text, cfg_.partials_dir, tpl, err_)) return false;

  kainjow::mustache::mustache view(tpl);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }
  // plain text reports, no HTML escaping
  view.set_custom_escape([](const std::string& s) { return s; });

  kainjow::mustache::data data = item_data(ctx.values);
  for (const auto& l : ctx.lists) {
    kainjow::mustache::data list{kainjow::mustache::data::type::list};
    for (const auto& item : l.second) list.push_back(item_data(item));
    data.set(l.first, list);
  }

  out = view.render(data);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }
  return true;
}

bool MustacheRenderer::render_to_file(std::string_view template_name,
                                      const TemplateContext& ctx,
                                      std::string_view out_path) {
  err_.clear();
  const fs::path tpl_path = fs::path(cfg_.template_dir) / std::string(template_name);
  std::string tpl;
  if (!read_text(tpl_path, tpl)) { err_ = "cannot read template " + tpl_path.string(); return false; }

  std::string rendered;
  if (!render_string(tpl, ctx, rendered)) return false;

  const fs::path dst{std::string(out_path)};
  if (!ensure_parent_dirs(dst)) { err_ = "cannot create directories for " + dst.string(); return false; }
  std::ofstream out(dst, std::ios::binary);
  out.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
  if (!out) { err_ = "write failed: " + dst.string(); return false; }
  return true;
}

}
