/*
    SplitRandR
    Copyright (c) 2026, SplitRandR contributors
    Copyright (c) 2020, Ruslan Kabatsayev
    Copyright (c) 2015, Phillip Berndt

    Resolution-independent binary partition of an output into leaf regions.
*/

#ifndef SPLITRANDR_SPLIT_TREE_H
#define SPLITRANDR_SPLIT_TREE_H

#include <memory>
#include <string>
#include <vector>

namespace splitrandr
{

// Horizontal: the dividing line is horizontal, children are top/bottom and
// the proportion is taken from the height. Vertical: left/right, width.
enum class SplitDirection
{
    Horizontal,
    Vertical
};

struct Rect
{
    int      x = 0;
    int      y = 0;
    unsigned width = 0;
    unsigned height = 0;

    Rect() = default;
    Rect(int x, int y, unsigned width, unsigned height)
        : x(x), y(y), width(width), height(height)
    {
    }
    bool operator==(Rect const& other) const
    {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(Rect const& other) const { return !(*this == other); }
};

struct SplitNode
{
    bool           leaf = true;
    SplitDirection direction = SplitDirection::Vertical;
    double         proportion = 0.5;

    std::unique_ptr<SplitNode> before;
    std::unique_ptr<SplitNode> after;
};

class SplitTree
{
public:
    SplitTree();
    SplitTree(SplitTree const& other);
    SplitTree(SplitTree&& other) noexcept;
    SplitTree& operator=(SplitTree const& other);
    SplitTree& operator=(SplitTree&& other) noexcept;
    ~SplitTree();

    static SplitTree makeSplit(SplitDirection direction, double proportion, SplitTree before, SplitTree after);

    SplitNode const& root() const { return *root_; }
    bool isLeaf() const { return root_->leaf; }
    unsigned leafCount() const;
    unsigned splitCount() const;

    bool operator==(SplitTree const& other) const;
    bool operator!=(SplitTree const& other) const { return !(*this == other); }

    // Text notation: N, V<p>(<node>,<node>), H<p>(<node>,<node>)
    std::string toString() const;

private:
    explicit SplitTree(std::unique_ptr<SplitNode> root);

    std::unique_ptr<SplitNode> root_;

    friend bool insert_split(SplitTree const&, unsigned, SplitDirection, double, SplitTree&);
    friend bool remove_split(SplitTree const&, unsigned, SplitTree&);
    friend bool parse_split_tree(std::string const&, SplitTree&);
};

/*
    Leaf rectangles of the tree laid over a width x height area, ordered
    before-first. Each cut is rounded to the nearest pixel and the after child
    absorbs the residual, so the rectangles tile the area exactly. Cuts are
    clamped so every leaf keeps at least one pixel whenever the area is at
    least leafCount() pixels along both axes.
*/
std::vector<Rect> resolve(SplitTree const& tree, unsigned width, unsigned height);

// Pixel offset of the node's cut inside a parent extent, as used by resolve()
unsigned cut_position(SplitNode const& node, unsigned extent);

// Replaces the leaf with before-first index leafIndex by a split of two leaves.
bool insert_split(SplitTree const& tree, unsigned leafIndex, SplitDirection direction, double proportion, SplitTree& result);

// Collapses the split with pre-order index splitIndex into a single leaf.
bool remove_split(SplitTree const& tree, unsigned splitIndex, SplitTree& result);

bool parse_split_tree(std::string const& text, SplitTree& result);

/*
    Rebuilds a tree from ordered leaf rectangles relative to the output origin,
    e.g. read back from existing virtual monitors. Regions that cannot be
    separated by a single cut collapse into a leaf.
*/
SplitTree split_tree_from_regions(std::vector<Rect> const& regions, unsigned width, unsigned height);

} // namespace splitrandr

#endif // SPLITRANDR_SPLIT_TREE_H
