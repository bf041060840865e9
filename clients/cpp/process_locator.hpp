/**
 * @file process_locator.hpp
 * @brief Finds the running Language Server and the port serving its API
 */

#ifndef LSQUOTA_PROCESS_LOCATOR_HPP
#define LSQUOTA_PROCESS_LOCATOR_HPP

#include "language_server_api.hpp"
#include "process_table.hpp"
#include "quota_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lsquota {

class ProcessLocator {
public:
    /**
     * @param table Process source
     * @param probe Used to validate listening ports
     * @param process_name Binary-name fragment identifying the Language Server
     */
    ProcessLocator(ProcessTable& table, PortProbe& probe, std::string process_name);

    /**
     * @brief Processes that look like the Language Server, in pid order
     *
     * Processes without a CSRF token, and processes whose sockets cannot be
     * inspected, are left out.
     */
    std::vector<ProcessCandidate> find_candidates();

    /**
     * @brief Probe candidate ports in ascending order, first success wins
     *
     * @return The validated connection, or std::nullopt when no process
     *         matches or none of their ports answers
     */
    std::optional<Connection> locate();

private:
    ProcessTable& table_;
    PortProbe& probe_;
    std::string process_name_;
};

} // namespace lsquota

#endif // LSQUOTA_PROCESS_LOCATOR_HPP
