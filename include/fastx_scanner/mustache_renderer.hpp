#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fx {

// Flat values plus named lists of items. A list with one item doubles as a
// conditional section; an empty list hides it.
struct TemplateContext {
  using Item = std::vector<std::pair<std::string, std::string>>;

  Item values;
  std::vector<std::pair<std::string, std::vector<Item>>> lists;

  void set(std::string key, std::string value);
  void add_item(const std::string& list, Item item);
  void declare_list(const std::string& list);
};

class MustacheRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string partials_dir = "templates/partials";
  };

  MustacheRenderer();
  explicit MustacheRenderer(Config cfg);

  // "{{> name}}" loads partials_dir/name.mustache (or partials_dir/name).
  // A missing partial is an error.
  bool render_string(std::string_view tpl, const TemplateContext& ctx, std::string& out);

  bool render_to_file(std::string_view template_name,
                      const TemplateContext& ctx,
                      std::string_view out_path);

  const std::string& last_error() const noexcept { return err_; }

private:
  Config cfg_;
  std::string err_;
};

}
