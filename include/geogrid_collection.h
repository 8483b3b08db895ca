#pragma once
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "geogrid.h"
#include "geogrid_grid.h"
#include "geogrid_table.h"

namespace GeoGrid
{
enum class MemberKind
{
    Grid,
    Table,
    Collection
};

GEOGRID_DLL const char* MemberKindName(MemberKind eKind);

/**
 * @brief Lightweight description of a collection member
 *
 * Listing a collection produces descriptors only; the member itself is
 * opened by Collection::Resolve().
 */
struct MemberDescriptor
{
    std::string identifier;
    MemberKind kind = MemberKind::Grid;
    // Queryable attributes, e.g. "driver" or "extension"
    std::map<std::string, std::string> attributes;
};

/**
 * @brief Selection of members by identifier wildcard, kind and attributes
 *
 * An empty filter matches every member.
 */
class GEOGRID_DLL MemberFilter
{
  public:
    MemberFilter() = default;

    static MemberFilter ByIdentifier(const std::string& pattern);

    /**
     * @param pattern Shell-style wildcard supporting '*' and '?'
     */
    MemberFilter& SetIdentifierPattern(const std::string& pattern);
    MemberFilter& SetKind(MemberKind eKind);
    MemberFilter& AddAttribute(const std::string& name, const std::string& value);

    bool Matches(const MemberDescriptor& descriptor) const;

  private:
    std::string mPattern;
    bool mHasKind = false;
    MemberKind mKind = MemberKind::Grid;
    std::map<std::string, std::string> mAttributes;
};

class Collection;
using CollectionPtr = std::shared_ptr<const Collection>;

/**
 * @brief A resolved member: the descriptor plus the opened object
 */
class GEOGRID_DLL Member
{
  public:
    Member(const MemberDescriptor& descriptor, GridPtr grid);
    Member(const MemberDescriptor& descriptor, TablePtr table);
    Member(const MemberDescriptor& descriptor, CollectionPtr collection);

    const MemberDescriptor& GetDescriptor() const { return mDescriptor; }
    const std::string& GetIdentifier() const { return mDescriptor.identifier; }
    MemberKind GetKind() const { return mDescriptor.kind; }

    /**
     * @throws std::logic_error when the member is of another kind
     */
    GridPtr GetGrid() const;
    TablePtr GetTable() const;
    CollectionPtr GetCollection() const;

  private:
    MemberDescriptor mDescriptor;
    GridPtr mGrid;
    TablePtr mTable;
    CollectionPtr mCollection;
};

/**
 * @brief One pass over the members of a collection
 */
class GEOGRID_DLL MemberCursor
{
  public:
    virtual ~MemberCursor();

    /**
     * @return false once every member has been produced
     */
    virtual bool Next(MemberDescriptor& descriptor) = 0;
};

/**
 * @brief Lazy, restartable listing of a collection
 *
 * Nothing is read until iteration starts, and every begin() or Open()
 * rescans the backing store. The sequence refers to its collection, which
 * must outlive it.
 */
class GEOGRID_DLL MemberSequence
{
  public:
    using CursorFactory = std::function<std::unique_ptr<MemberCursor>()>;

    MemberSequence(CursorFactory factory, const MemberFilter& filter);

    /**
     * @brief Start a new pass, filtered
     */
    std::unique_ptr<MemberCursor> Open() const;

    class GEOGRID_DLL Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = MemberDescriptor;
        using difference_type = std::ptrdiff_t;
        using pointer = const MemberDescriptor*;
        using reference = const MemberDescriptor&;

        Iterator() = default;
        explicit Iterator(std::shared_ptr<MemberCursor> cursor);

        reference operator*() const { return mCurrent; }
        pointer operator->() const { return &mCurrent; }
        Iterator& operator++();

        bool operator==(const Iterator& other) const { return mCursor == other.mCursor; }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

      private:
        void Advance();

        std::shared_ptr<MemberCursor> mCursor;
        MemberDescriptor mCurrent;
    };

    Iterator begin() const;
    Iterator end() const { return Iterator(); }

    std::vector<MemberDescriptor> ToVector() const;

  private:
    CursorFactory mFactory;
    MemberFilter mFilter;
};

/**
 * @brief Named grouping of grids, tables and nested collections
 */
class GEOGRID_DLL Collection
{
  public:
    virtual ~Collection();

    Collection(const Collection&) = delete;
    Collection& operator=(const Collection&) = delete;

    virtual std::string GetDisplayName() const = 0;

    /**
     * @brief Identity of the backing store, used to detect cycles
     */
    virtual std::string GetIdentity() const = 0;

    MemberSequence List(const MemberFilter& filter = MemberFilter()) const;

    /**
     * @throws NotFoundError when no member has this identifier
     */
    Member Resolve(const std::string& identifier) const;

    /**
     * @throws NotFoundError when nothing matches
     * @throws AmbiguousIdentifierError when more than one member matches
     */
    Member Resolve(const MemberFilter& filter) const;

    std::vector<Member> ResolveAll(const MemberFilter& filter = MemberFilter()) const;

    /**
     * @brief Open the member a descriptor listed by this collection refers to
     */
    Member Open(const MemberDescriptor& descriptor) const { return OpenMember(descriptor); }

  protected:
    Collection() = default;

    virtual std::unique_ptr<MemberCursor> OpenCursor() const = 0;

    virtual Member OpenMember(const MemberDescriptor& descriptor) const = 0;

    /**
     * @brief Find one member by exact identifier
     *
     * The default scans the listing. Backends with direct lookup override it.
     * @throws AmbiguousIdentifierError if several members share the identifier
     */
    virtual bool FindDescriptor(const std::string& identifier, MemberDescriptor& descriptor) const;
};

/**
 * @brief Collection whose members are added in code
 */
class GEOGRID_DLL MemoryCollection : public Collection
{
  public:
    explicit MemoryCollection(const std::string& displayName);

    /**
     * @throws std::invalid_argument on an empty or duplicate identifier
     *         or a null member
     */
    void AddGrid(const std::string& identifier, GridPtr grid,
                 const std::map<std::string, std::string>& attributes = {});
    void AddTable(const std::string& identifier, TablePtr table,
                  const std::map<std::string, std::string>& attributes = {});
    void AddCollection(const std::string& identifier, CollectionPtr collection,
                       const std::map<std::string, std::string>& attributes = {});

    bool Remove(const std::string& identifier);

    std::string GetDisplayName() const override { return mDisplayName; }
    std::string GetIdentity() const override { return mIdentity; }

  protected:
    std::unique_ptr<MemberCursor> OpenCursor() const override;
    Member OpenMember(const MemberDescriptor& descriptor) const override;
    bool FindDescriptor(const std::string& identifier, MemberDescriptor& descriptor) const override;

  private:
    void AddMember(const Member& member);

    std::string mDisplayName;
    std::string mIdentity;

    mutable std::mutex mMutex;
    std::vector<Member> mMembers;
};

/**
 * @brief Called for every matching member; path holds the identifiers of
 *        the enclosing collections below the root
 */
using CollectionVisitor = std::function<void(const std::vector<std::string>& path, const Member& member)>;

/**
 * @brief Depth-first walk of a collection hierarchy
 *
 * Nested collections are descended whether or not the filter matches them.
 * @throws CyclicCollectionError when a collection is reached again from
 *         inside itself
 */
GEOGRID_DLL void Traverse(const Collection& root,
                          const CollectionVisitor& visitor,
                          const MemberFilter& filter = MemberFilter());
}  // namespace GeoGrid
