#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: frame_graph.hpp
    MODULE: pipeline
    PURPOSE: Lightweight frame graph ordering anti-aliasing nodes from their declared
             resource IO and validating the dependencies.
*/


#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <queue>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "tsaa/pipeline/render_pass.hpp"

namespace tsaa
{
    struct FrameGraphNode
    {
        IRenderPass* pass = nullptr;
        std::string pass_id{};
        PassIODesc io{};
        size_t original_index = 0;
    };

    struct FrameGraphReport
    {
        bool valid = true;
        std::vector<std::string> errors{};
        std::vector<std::string> warnings{};
        // Names read by some node that no node writes and the host did not import.
        std::vector<std::string> unresolved_reads{};
    };

    class FrameGraph
    {
    public:
        void clear()
        {
            nodes_.clear();
            execution_order_.clear();
            report_ = FrameGraphReport{};
        }

        void add_node(FrameGraphNode node)
        {
            node.original_index = nodes_.size();
            nodes_.push_back(std::move(node));
        }

        void add_pass(IRenderPass* pass)
        {
            if (!pass) return;
            FrameGraphNode node{};
            node.pass = pass;
            node.pass_id = pass->id();
            node.io = pass->describe_io();
            add_node(std::move(node));
        }

        const std::vector<FrameGraphNode>& nodes() const { return nodes_; }
        const std::vector<size_t>& execution_order() const { return execution_order_; }
        const FrameGraphReport& report() const { return report_; }

        std::vector<IRenderPass*> ordered_passes() const
        {
            std::vector<IRenderPass*> out{};
            out.reserve(execution_order_.size());
            for (size_t i : execution_order_)
            {
                if (i < nodes_.size() && nodes_[i].pass) out.push_back(nodes_[i].pass);
            }
            return out;
        }

        bool produces(const std::string& name) const
        {
            const uint64_t key = pass_resource_key(name);
            for (const auto& n : nodes_)
            {
                for (const auto& r : n.io.resources)
                {
                    if (r.key == key && pass_access_has_write(r.access)) return true;
                }
            }
            return false;
        }

        bool compile(const std::vector<std::string>& imported = {})
        {
            report_ = FrameGraphReport{};
            execution_order_.clear();
            if (nodes_.empty()) return true;

            const size_t n = nodes_.size();
            std::vector<std::vector<size_t>> edges(n);
            std::vector<int> indegree(n, 0);

            auto add_edge = [&](size_t a, size_t b)
            {
                if (a == b) return;
                auto& e = edges[a];
                if (std::find(e.begin(), e.end(), b) != e.end()) return;
                e.push_back(b);
                indegree[b]++;
            };

            for (size_t i = 0; i < n; ++i)
            {
                const auto& ni = nodes_[i];
                for (size_t j = i + 1; j < n; ++j)
                {
                    const auto& nj = nodes_[j];
                    for (const auto& ri : ni.io.resources)
                    {
                        if (ri.key == 0) continue;
                        for (const auto& rj : nj.io.resources)
                        {
                            if (rj.key == 0 || rj.key != ri.key) continue;

                            const PassResourceAccess ai = ri.access;
                            const PassResourceAccess aj = rj.access;
                            if (ai == PassResourceAccess::Read && aj == PassResourceAccess::Read) continue;

                            if (ai == aj)
                            {
                                // Two writers of the same version keep insertion order.
                                add_edge(i, j);
                            }
                            else if (ai == PassResourceAccess::Write)
                            {
                                add_edge(i, j);
                            }
                            else if (aj == PassResourceAccess::Write)
                            {
                                add_edge(j, i);
                            }
                            else if (ai == PassResourceAccess::Read)
                            {
                                // Plain reads see the incoming version, before it is replaced.
                                add_edge(i, j);
                            }
                            else
                            {
                                add_edge(j, i);
                            }

                            if (ri.kind != rj.kind && ri.kind != FrameResourceKind::Unknown && rj.kind != FrameResourceKind::Unknown)
                            {
                                report_.warnings.push_back(
                                    "Resource kind mismatch on '" + ri.name + "' between passes '" + ni.pass_id + "' ("
                                    + frame_resource_kind_name(ri.kind) + ") and '" + nj.pass_id + "' ("
                                    + frame_resource_kind_name(rj.kind) + ")."
                                );
                            }
                        }
                    }
                }
            }

            std::unordered_set<uint64_t> available{};
            for (const auto& name : imported) available.insert(pass_resource_key(name));
            for (const auto& node : nodes_)
            {
                for (const auto& r : node.io.resources)
                {
                    if (pass_access_has_write(r.access)) available.insert(r.key);
                }
            }
            for (const auto& node : nodes_)
            {
                for (const auto& r : node.io.resources)
                {
                    if (r.access != PassResourceAccess::Read || available.count(r.key) != 0) continue;
                    if (std::find(report_.unresolved_reads.begin(), report_.unresolved_reads.end(), r.name) != report_.unresolved_reads.end()) continue;
                    report_.unresolved_reads.push_back(r.name);
                    report_.warnings.push_back("Pass '" + node.pass_id + "' reads '" + r.name + "' which nothing produces.");
                }
            }

            std::vector<size_t> zero_nodes{};
            zero_nodes.reserve(n);
            for (size_t i = 0; i < n; ++i)
            {
                if (indegree[i] == 0) zero_nodes.push_back(i);
            }

            auto later = [&](size_t a, size_t b)
            {
                return nodes_[a].original_index > nodes_[b].original_index;
            };
            std::priority_queue<size_t, std::vector<size_t>, decltype(later)> q(later);
            for (size_t i : zero_nodes) q.push(i);
            while (!q.empty())
            {
                const size_t v = q.top();
                q.pop();
                execution_order_.push_back(v);
                for (size_t to : edges[v])
                {
                    indegree[to]--;
                    if (indegree[to] == 0) q.push(to);
                }
            }

            if (execution_order_.size() != n)
            {
                report_.valid = false;
                std::string members{};
                for (size_t i = 0; i < n; ++i)
                {
                    if (indegree[i] <= 0) continue;
                    if (!members.empty()) members += ", ";
                    members += nodes_[i].pass_id;
                }
                report_.errors.push_back("FrameGraph cycle detected in pass resource dependencies (" + members + ").");
                execution_order_.clear();
                return false;
            }

            bool reordered = false;
            for (size_t i = 0; i < n; ++i)
            {
                if (execution_order_[i] != i)
                {
                    reordered = true;
                    break;
                }
            }
            if (reordered)
            {
                report_.warnings.push_back("FrameGraph reordered passes to satisfy resource dependencies.");
            }

            return report_.valid;
        }

    private:
        std::vector<FrameGraphNode> nodes_{};
        std::vector<size_t> execution_order_{};
        FrameGraphReport report_{};
    };
}
