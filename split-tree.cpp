/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt
*/

#include <stdio.h>
#include <stdlib.h>
#include <math.h>
#include <algorithm>
#include <initializer_list>
#include <set>

#include "split-tree.h"

namespace splitrandr
{

namespace
{

std::unique_ptr<SplitNode> newLeaf()
{
    return std::unique_ptr<SplitNode>(new SplitNode);
}

std::unique_ptr<SplitNode> cloneNode(SplitNode const& node)
{
    auto copy = newLeaf();
    copy->leaf = node.leaf;
    copy->direction = node.direction;
    copy->proportion = node.proportion;
    if(!node.leaf)
    {
        copy->before = cloneNode(*node.before);
        copy->after = cloneNode(*node.after);
    }
    return copy;
}

unsigned countLeaves(SplitNode const& node)
{
    if(node.leaf)
        return 1;
    return countLeaves(*node.before) + countLeaves(*node.after);
}

bool nodesEqual(SplitNode const& a, SplitNode const& b)
{
    if(a.leaf != b.leaf)
        return false;
    if(a.leaf)
        return true;
    return a.direction == b.direction && a.proportion == b.proportion &&
           nodesEqual(*a.before, *b.before) && nodesEqual(*a.after, *b.after);
}

// Smallest number of pixels the subtree needs along one axis so that no leaf is empty
unsigned minExtent(SplitNode const& node, SplitDirection axis)
{
    if(node.leaf)
        return 1;
    const auto before = minExtent(*node.before, axis);
    const auto after = minExtent(*node.after, axis);
    if(node.direction == axis)
        return before + after;
    return std::max(before, after);
}

} // namespace

unsigned cut_position(SplitNode const& node, unsigned extent)
{
    const double exact = extent * node.proportion;
    long pos = lround(exact);
    if(pos < 0)
        pos = 0;
    if(pos > long(extent))
        pos = extent;

    const long lo = minExtent(*node.before, node.direction);
    const long hi = long(extent) - long(minExtent(*node.after, node.direction));
    if(lo <= hi)
        pos = std::min(std::max(pos, lo), hi);
    return pos;
}

namespace
{

void resolveInto(SplitNode const& node, int x, int y, unsigned width, unsigned height, std::vector<Rect>& out)
{
    if(node.leaf)
    {
        out.push_back(Rect(x, y, width, height));
        return;
    }
    if(node.direction == SplitDirection::Vertical)
    {
        const auto pos = cut_position(node, width);
        resolveInto(*node.before, x, y, pos, height, out);
        resolveInto(*node.after, x + pos, y, width - pos, height, out);
    }
    else
    {
        const auto pos = cut_position(node, height);
        resolveInto(*node.before, x, y, width, pos, out);
        resolveInto(*node.after, x, y + pos, width, height - pos, out);
    }
}

void printNode(SplitNode const& node, std::string& out)
{
    if(node.leaf)
    {
        out += 'N';
        return;
    }
    char proportion[32];
    snprintf(proportion, sizeof proportion, "%g", node.proportion);
    out += node.direction == SplitDirection::Vertical ? 'V' : 'H';
    out += proportion;
    out += '(';
    printNode(*node.before, out);
    out += ',';
    printNode(*node.after, out);
    out += ')';
}

// Recursive descent over the text notation; p is advanced past the node
std::unique_ptr<SplitNode> parseNode(const char*& p)
{
    while(*p == ' ')
        ++p;
    if(*p == 'N')
    {
        ++p;
        return newLeaf();
    }
    if(*p != 'H' && *p != 'V')
        return nullptr;

    auto node = newLeaf();
    node->leaf = false;
    node->direction = *p == 'V' ? SplitDirection::Vertical : SplitDirection::Horizontal;
    ++p;

    char* end = nullptr;
    node->proportion = strtod(p, &end);
    if(end == p || !(node->proportion > 0.0 && node->proportion < 1.0))
        return nullptr;
    p = end;

    if(*p++ != '(')
        return nullptr;
    node->before = parseNode(p);
    if(!node->before || *p++ != ',')
        return nullptr;
    node->after = parseNode(p);
    if(!node->after || *p++ != ')')
        return nullptr;
    return node;
}

// Replaces the leaf with the given before-first index, counting down as leaves are passed
bool insertAt(SplitNode& node, unsigned& leafIndex, SplitDirection direction, double proportion)
{
    if(node.leaf)
    {
        if(leafIndex-- != 0)
            return false;
        node.leaf = false;
        node.direction = direction;
        node.proportion = proportion;
        node.before = newLeaf();
        node.after = newLeaf();
        return true;
    }
    return insertAt(*node.before, leafIndex, direction, proportion) ||
           insertAt(*node.after, leafIndex, direction, proportion);
}

bool removeAt(SplitNode& node, unsigned& splitIndex)
{
    if(node.leaf)
        return false;
    if(splitIndex-- == 0)
    {
        node.leaf = true;
        node.before.reset();
        node.after.reset();
        return true;
    }
    return removeAt(*node.before, splitIndex) || removeAt(*node.after, splitIndex);
}

} // namespace

SplitTree::SplitTree()
    : root_(newLeaf())
{
}

SplitTree::SplitTree(std::unique_ptr<SplitNode> root)
    : root_(std::move(root))
{
}

SplitTree::SplitTree(SplitTree const& other)
    : root_(cloneNode(*other.root_))
{
}

SplitTree::SplitTree(SplitTree&& other) noexcept
    : root_(std::move(other.root_))
{
    other.root_.reset(new SplitNode);
}

SplitTree& SplitTree::operator=(SplitTree const& other)
{
    if(this != &other)
        root_ = cloneNode(*other.root_);
    return *this;
}

SplitTree& SplitTree::operator=(SplitTree&& other) noexcept
{
    if(this != &other)
    {
        root_ = std::move(other.root_);
        other.root_.reset(new SplitNode);
    }
    return *this;
}

SplitTree::~SplitTree() = default;

SplitTree SplitTree::makeSplit(SplitDirection direction, double proportion, SplitTree before, SplitTree after)
{
    auto node = newLeaf();
    node->leaf = false;
    node->direction = direction;
    node->proportion = proportion;
    node->before = std::move(before.root_);
    node->after = std::move(after.root_);
    return SplitTree(std::move(node));
}

unsigned SplitTree::leafCount() const
{
    return countLeaves(*root_);
}

unsigned SplitTree::splitCount() const
{
    return leafCount() - 1;
}

bool SplitTree::operator==(SplitTree const& other) const
{
    return nodesEqual(*root_, *other.root_);
}

std::string SplitTree::toString() const
{
    std::string out;
    printNode(*root_, out);
    return out;
}

std::vector<Rect> resolve(SplitTree const& tree, unsigned width, unsigned height)
{
    std::vector<Rect> rects;
    rects.reserve(tree.leafCount());
    resolveInto(tree.root(), 0, 0, width, height, rects);
    return rects;
}

bool insert_split(SplitTree const& tree, unsigned leafIndex, SplitDirection direction, double proportion, SplitTree& result)
{
    if(!(proportion > 0.0 && proportion < 1.0))
        return false;
    auto copy = cloneNode(*tree.root_);
    if(!insertAt(*copy, leafIndex, direction, proportion))
        return false;
    result = SplitTree(std::move(copy));
    return true;
}

bool remove_split(SplitTree const& tree, unsigned splitIndex, SplitTree& result)
{
    auto copy = cloneNode(*tree.root_);
    if(!removeAt(*copy, splitIndex))
        return false;
    result = SplitTree(std::move(copy));
    return true;
}

bool parse_split_tree(std::string const& text, SplitTree& result)
{
    const char* p = text.c_str();
    auto root = parseNode(p);
    if(!root)
        return false;
    while(*p == ' ')
        ++p;
    if(*p)
        return false;
    result = SplitTree(std::move(root));
    return true;
}

SplitTree split_tree_from_regions(std::vector<Rect> const& regions, unsigned width, unsigned height)
{
    if(regions.size() <= 1)
        return SplitTree();

    // Try a vertical cut first, then a horizontal one, at every region edge
    for(const auto direction : {SplitDirection::Vertical, SplitDirection::Horizontal})
    {
        const bool vertical = direction == SplitDirection::Vertical;
        std::set<long> edges;
        for(const auto& r : regions)
        {
            edges.insert(vertical ? r.x : r.y);
            edges.insert(vertical ? r.x + long(r.width) : r.y + long(r.height));
        }
        for(const auto edge : edges)
        {
            std::vector<Rect> before, after;
            for(const auto& r : regions)
            {
                const long start = vertical ? r.x : r.y;
                const long end = start + long(vertical ? r.width : r.height);
                if(end <= edge)
                    before.push_back(r);
                else if(start >= edge)
                {
                    Rect shifted = r;
                    if(vertical)
                        shifted.x -= edge;
                    else
                        shifted.y -= edge;
                    after.push_back(shifted);
                }
            }
            if(before.empty() || after.empty() || before.size() + after.size() != regions.size())
                continue;

            const unsigned extent = vertical ? width : height;
            if(edge <= 0 || edge >= long(extent))
                continue;
            const double proportion = double(edge) / extent;
            if(vertical)
                return SplitTree::makeSplit(direction, proportion,
                                            split_tree_from_regions(before, edge, height),
                                            split_tree_from_regions(after, width - edge, height));
            return SplitTree::makeSplit(direction, proportion,
                                        split_tree_from_regions(before, width, edge),
                                        split_tree_from_regions(after, width, height - edge));
        }
    }
    return SplitTree();
}

} // namespace splitrandr
