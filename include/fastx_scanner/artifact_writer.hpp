#pragma once
#include <string>

#include "fastx_scanner/mustache_renderer.hpp"

namespace fx {

// Writes into <report_root>/<slug>/:
//   run.json     (as given)
//   summary.txt  (summary.mustache rendered with `summary`)
bool write_report_dir(const std::string& report_root,
                      const std::string& slug,
                      const std::string& run_json_str,
                      const TemplateContext& summary,
                      const std::string& template_dir,
                      std::string* err_out = nullptr);

}
