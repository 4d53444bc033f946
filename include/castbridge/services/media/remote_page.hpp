#pragma once

#include <string>

namespace castbridge::services {

// Self-contained page served at GET /remote. It reads /remote/info and
// /remote/status, uploads files to /remote/upload, submits links to
// /remote/url and sends transport controls to /remote/control.
const std::string& remote_page_html();

} // namespace castbridge::services
