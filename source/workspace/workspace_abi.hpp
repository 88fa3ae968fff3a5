#ifndef CTXBRIDGE_WORKSPACE_ABI_HPP
#define CTXBRIDGE_WORKSPACE_ABI_HPP

// Workspace abstraction interface.
// The dispatcher only needs to know whether a trusted folder is open; command handlers use the
// richer LocalWorkspace. Tests substitute their own implementation.

namespace workspace {

class WorkspaceContext {
public:
    virtual ~WorkspaceContext() = default;

    virtual bool is_trusted() const = 0;
    virtual bool has_open_folder() const = 0;

    bool is_trusted_and_open() const { return is_trusted() && has_open_folder(); }
};

} // namespace workspace

#endif // CTXBRIDGE_WORKSPACE_ABI_HPP
