/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

report_options.hpp declarations.*/

#pragma once

namespace q3log {

// Sections of the plain-text summary.
struct ReportOptions {
	bool text = true;
	bool players = true;
	bool killsByMeans = true;
	bool killers = true;
	bool ranking = true;
};

} // namespace q3log
