#pragma once

#include <pydep/ModuleInfo.hpp>
#include <pydep/analysis.hpp>
#include <pydep/pydep.hpp>

#include <chrono>
#include <ostream>
#include <vector>

namespace mdev::pydep::cli {

void print_report( std::ostream& os, const ProjectGraph& graph, const QueryResult& result );

void print_scan_errors( std::ostream& os, const std::vector<FileInfo>& files );

void print_scan_stats( std::ostream&                       os,
					   std::size_t                         root_count,
					   const std::vector<FileInfo>&        files,
					   const ProjectGraph&                 graph,
					   std::chrono::steady_clock::duration scan_time );

} // namespace mdev::pydep::cli
