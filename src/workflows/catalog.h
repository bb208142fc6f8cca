// workflows/catalog.h
#ifndef AGENTGRAPH_WORKFLOWS_CATALOG_H
#define AGENTGRAPH_WORKFLOWS_CATALOG_H

#include "workflows/workflow.h"
#include <map>
#include <string>
#include <vector>

namespace agentgraph {

// 名称 -> 工厂。内置工作流在构造时注册
class WorkflowCatalog {
public:
    WorkflowCatalog();

    // Throws GraphError on a duplicate name.
    void register_workflow(const std::string& name, std::string description, WorkflowFactory factory);

    bool contains(const std::string& name) const { return entries_.count(name) > 0; }
    std::vector<std::string> names() const;
    const std::string& description(const std::string& name) const;

    // Throws WorkflowError for an unknown name.
    Workflow build(const std::string& name, const WorkflowServices& services) const;

private:
    struct Entry {
        std::string description;
        WorkflowFactory factory;
    };
    std::map<std::string, Entry> entries_;

    const Entry& entry(const std::string& name) const;
};

} // namespace agentgraph

#endif // AGENTGRAPH_WORKFLOWS_CATALOG_H
