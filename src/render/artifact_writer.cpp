#include "fastx_scanner/artifact_writer.hpp"
#include "fastx_scanner/path_utils.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fx {

bool write_report_dir(const std::string& report_root,
                      const std::string& slug,
                      const std::string& run_json_str,
                      const TemplateContext& summary,
                      const std::string& template_dir,
                      std::string* err_out) {
  const std::filesystem::path out_dir =
      std::filesystem::path(report_root) / slug;

  {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
      if (err_out) *err_out = "cannot create " + out_dir.string() + ": " + ec.message();
      return false;
    }
    std::ofstream rj(out_dir / "run.json", std::ios::binary);
    if (!rj) {
      if (err_out) *err_out = "failed to write run.json";
      return false;
    }
    rj.write(run_json_str.data(),
             static_cast<std::streamsize>(run_json_str.size()));
    if (!rj) {
      if (err_out) *err_out = "failed to write run.json";
      return false;
    }
  }

  fx::MustacheRenderer::Config rcfg;
  rcfg.template_dir = template_dir;
  rcfg.partials_dir = rcfg.template_dir + "/partials";

  fx::MustacheRenderer renderer(rcfg);
  const bool ok = renderer.render_to_file("summary.mustache", summary,
                                          (out_dir / "summary.txt").string());
  if (!ok && err_out) *err_out = renderer.last_error();
  return ok;
}

}
