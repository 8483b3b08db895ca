#include "geogrid_collection.h"

#include <atomic>
#include <set>
#include <stdexcept>
#include <utility>

#include "cpl_string.h"
#include "geogrid_errors.h"
#include "geogrid_path_utils.h"

namespace GeoGrid
{
const char* MemberKindName(MemberKind eKind)
{
    switch (eKind)
    {
        case MemberKind::Grid:
            return "grid";
        case MemberKind::Table:
            return "table";
        case MemberKind::Collection:
            return "collection";
    }
    return "unknown";
}

// ============================================================================
// MemberFilter
// ============================================================================

MemberFilter MemberFilter::ByIdentifier(const std::string& pattern)
{
    MemberFilter filter;
    filter.SetIdentifierPattern(pattern);
    return filter;
}

MemberFilter& MemberFilter::SetIdentifierPattern(const std::string& pattern)
{
    mPattern = pattern;
    return *this;
}

MemberFilter& MemberFilter::SetKind(MemberKind eKind)
{
    mHasKind = true;
    mKind = eKind;
    return *this;
}

MemberFilter& MemberFilter::AddAttribute(const std::string& name, const std::string& value)
{
    mAttributes[name] = value;
    return *this;
}

bool MemberFilter::Matches(const MemberDescriptor& descriptor) const
{
    if (mHasKind && descriptor.kind != mKind)
        return false;

    if (!mPattern.empty() && !PathUtils::PathParser::MatchWildcard(mPattern, descriptor.identifier))
        return false;

    for (const auto& wanted : mAttributes)
    {
        auto it = descriptor.attributes.find(wanted.first);
        if (it == descriptor.attributes.end() || it->second != wanted.second)
            return false;
    }
    return true;
}

// ============================================================================
// Member
// ============================================================================

Member::Member(const MemberDescriptor& descriptor, GridPtr grid)
    : mDescriptor(descriptor), mGrid(std::move(grid))
{
    mDescriptor.kind = MemberKind::Grid;
}

Member::Member(const MemberDescriptor& descriptor, TablePtr table)
    : mDescriptor(descriptor), mTable(std::move(table))
{
    mDescriptor.kind = MemberKind::Table;
}

Member::Member(const MemberDescriptor& descriptor, CollectionPtr collection)
    : mDescriptor(descriptor), mCollection(std::move(collection))
{
    mDescriptor.kind = MemberKind::Collection;
}

static std::logic_error WrongKind(const MemberDescriptor& descriptor, const char* pszWanted)
{
    return std::logic_error("Member '" + descriptor.identifier + "' is a " +
                            MemberKindName(descriptor.kind) + ", not a " + pszWanted);
}

GridPtr Member::GetGrid() const
{
    if (!mGrid)
        throw WrongKind(mDescriptor, "grid");
    return mGrid;
}

TablePtr Member::GetTable() const
{
    if (!mTable)
        throw WrongKind(mDescriptor, "table");
    return mTable;
}

CollectionPtr Member::GetCollection() const
{
    if (!mCollection)
        throw WrongKind(mDescriptor, "collection");
    return mCollection;
}

// ============================================================================
// MemberSequence
// ============================================================================

MemberCursor::~MemberCursor() = default;

namespace
{
class FilteringCursor : public MemberCursor
{
  public:
    FilteringCursor(std::unique_ptr<MemberCursor> base, const MemberFilter& filter)
        : mBase(std::move(base)), mFilter(filter)
    {
    }

    bool Next(MemberDescriptor& descriptor) override
    {
        while (mBase->Next(descriptor))
        {
            if (mFilter.Matches(descriptor))
                return true;
        }
        return false;
    }

  private:
    std::unique_ptr<MemberCursor> mBase;
    MemberFilter mFilter;
};
}  // namespace

MemberSequence::MemberSequence(CursorFactory factory, const MemberFilter& filter)
    : mFactory(std::move(factory)), mFilter(filter)
{
}

std::unique_ptr<MemberCursor> MemberSequence::Open() const
{
    return std::unique_ptr<MemberCursor>(new FilteringCursor(mFactory(), mFilter));
}

MemberSequence::Iterator::Iterator(std::shared_ptr<MemberCursor> cursor) : mCursor(std::move(cursor))
{
    Advance();
}

MemberSequence::Iterator& MemberSequence::Iterator::operator++()
{
    Advance();
    return *this;
}

void MemberSequence::Iterator::Advance()
{
    if (mCursor && !mCursor->Next(mCurrent))
        mCursor.reset();
}

MemberSequence::Iterator MemberSequence::begin() const
{
    return Iterator(std::shared_ptr<MemberCursor>(Open()));
}

std::vector<MemberDescriptor> MemberSequence::ToVector() const
{
    std::vector<MemberDescriptor> descriptors;
    std::unique_ptr<MemberCursor> cursor = Open();
    MemberDescriptor descriptor;
    while (cursor->Next(descriptor))
        descriptors.push_back(descriptor);
    return descriptors;
}

// ============================================================================
// Collection
// ============================================================================

Collection::~Collection() = default;

MemberSequence Collection::List(const MemberFilter& filter) const
{
    return MemberSequence([this]() { return OpenCursor(); }, filter);
}

bool Collection::FindDescriptor(const std::string& identifier, MemberDescriptor& descriptor) const
{
    std::unique_ptr<MemberCursor> cursor = OpenCursor();
    MemberDescriptor candidate;
    bool found = false;
    while (cursor->Next(candidate))
    {
        if (candidate.identifier != identifier)
            continue;
        if (found)
            throw AmbiguousIdentifierError("Identifier '" + identifier + "' names several members of '" +
                                           GetDisplayName() + "'");
        descriptor = candidate;
        found = true;
    }
    return found;
}

Member Collection::Resolve(const std::string& identifier) const
{
    MemberDescriptor descriptor;
    if (!FindDescriptor(identifier, descriptor))
        throw NotFoundError("Collection '" + GetDisplayName() + "' has no member '" + identifier + "'");
    return OpenMember(descriptor);
}

Member Collection::Resolve(const MemberFilter& filter) const
{
    std::unique_ptr<MemberCursor> cursor = List(filter).Open();

    MemberDescriptor first;
    if (!cursor->Next(first))
        throw NotFoundError("No member of '" + GetDisplayName() + "' matches the filter");

    MemberDescriptor second;
    if (cursor->Next(second))
        throw AmbiguousIdentifierError("Filter matches several members of '" + GetDisplayName() +
                                       "', including '" + first.identifier + "' and '" +
                                       second.identifier + "'");
    return OpenMember(first);
}

std::vector<Member> Collection::ResolveAll(const MemberFilter& filter) const
{
    std::vector<Member> members;
    for (const MemberDescriptor& descriptor : List(filter))
        members.push_back(OpenMember(descriptor));
    return members;
}

// ============================================================================
// MemoryCollection
// ============================================================================

namespace
{
class SnapshotCursor : public MemberCursor
{
  public:
    explicit SnapshotCursor(std::vector<MemberDescriptor> descriptors)
        : mDescriptors(std::move(descriptors))
    {
    }

    bool Next(MemberDescriptor& descriptor) override
    {
        if (mNext >= mDescriptors.size())
            return false;
        descriptor = mDescriptors[mNext++];
        return true;
    }

  private:
    std::vector<MemberDescriptor> mDescriptors;
    size_t mNext = 0;
};

MemberDescriptor MakeDescriptor(const std::string& identifier,
                                const std::map<std::string, std::string>& attributes)
{
    if (identifier.empty())
        throw std::invalid_argument("Member identifier must not be empty");

    MemberDescriptor descriptor;
    descriptor.identifier = identifier;
    descriptor.attributes = attributes;
    return descriptor;
}
}  // namespace

MemoryCollection::MemoryCollection(const std::string& displayName) : mDisplayName(displayName)
{
    static std::atomic<unsigned long long> nextSerial{1};
    mIdentity = CPLSPrintf("memcollection:%llu", nextSerial.fetch_add(1));
}

void MemoryCollection::AddMember(const Member& member)
{
    std::lock_guard<std::mutex> lock(mMutex);
    for (const Member& existing : mMembers)
    {
        if (existing.GetIdentifier() == member.GetIdentifier())
            throw std::invalid_argument("Collection '" + mDisplayName + "' already has a member '" +
                                        member.GetIdentifier() + "'");
    }
    mMembers.push_back(member);
}

void MemoryCollection::AddGrid(const std::string& identifier, GridPtr grid,
                               const std::map<std::string, std::string>& attributes)
{
    if (!grid)
        throw std::invalid_argument("Cannot add a null grid as '" + identifier + "'");
    AddMember(Member(MakeDescriptor(identifier, attributes), std::move(grid)));
}

void MemoryCollection::AddTable(const std::string& identifier, TablePtr table,
                                const std::map<std::string, std::string>& attributes)
{
    if (!table)
        throw std::invalid_argument("Cannot add a null table as '" + identifier + "'");
    AddMember(Member(MakeDescriptor(identifier, attributes), std::move(table)));
}

void MemoryCollection::AddCollection(const std::string& identifier, CollectionPtr collection,
                                     const std::map<std::string, std::string>& attributes)
{
    if (!collection)
        throw std::invalid_argument("Cannot add a null collection as '" + identifier + "'");
    AddMember(Member(MakeDescriptor(identifier, attributes), std::move(collection)));
}

bool MemoryCollection::Remove(const std::string& identifier)
{
    std::lock_guard<std::mutex> lock(mMutex);
    for (auto it = mMembers.begin(); it != mMembers.end(); ++it)
    {
        if (it->GetIdentifier() == identifier)
        {
            mMembers.erase(it);
            return true;
        }
    }
    return false;
}

std::unique_ptr<MemberCursor> MemoryCollection::OpenCursor() const
{
    std::vector<MemberDescriptor> descriptors;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        descriptors.reserve(mMembers.size());
        for (const Member& member : mMembers)
            descriptors.push_back(member.GetDescriptor());
    }
    return std::unique_ptr<MemberCursor>(new SnapshotCursor(std::move(descriptors)));
}

bool MemoryCollection::FindDescriptor(const std::string& identifier, MemberDescriptor& descriptor) const
{
    std::lock_guard<std::mutex> lock(mMutex);
    for (const Member& member : mMembers)
    {
        if (member.GetIdentifier() == identifier)
        {
            descriptor = member.GetDescriptor();
            return true;
        }
    }
    return false;
}

Member MemoryCollection::OpenMember(const MemberDescriptor& descriptor) const
{
    std::lock_guard<std::mutex> lock(mMutex);
    for (const Member& member : mMembers)
    {
        if (member.GetIdentifier() == descriptor.identifier)
            return member;
    }
    throw NotFoundError("Member '" + descriptor.identifier + "' was removed from '" + mDisplayName + "'");
}

// ============================================================================
// Traverse
// ============================================================================

static void TraverseCollection(const Collection& collection,
                               const CollectionVisitor& visitor,
                               const MemberFilter& filter,
                               std::vector<std::string>& path,
                               std::set<std::string>& onPath)
{
    for (const MemberDescriptor& descriptor : collection.List())
    {
        const bool matches = filter.Matches(descriptor);
        if (!matches && descriptor.kind != MemberKind::Collection)
            continue;

        const Member member = collection.Open(descriptor);
        if (matches)
            visitor(path, member);

        if (member.GetKind() != MemberKind::Collection)
            continue;

        CollectionPtr child = member.GetCollection();
        const std::string childIdentity = child->GetIdentity();
        if (onPath.count(childIdentity))
        {
            std::string route;
            for (const std::string& step : path)
                route += step + "/";
            throw CyclicCollectionError("Collection '" + child->GetDisplayName() + "' at '" + route +
                                        descriptor.identifier + "' contains itself");
        }

        onPath.insert(childIdentity);
        path.push_back(descriptor.identifier);
        TraverseCollection(*child, visitor, filter, path, onPath);
        path.pop_back();
        onPath.erase(childIdentity);
    }
}

void Traverse(const Collection& root, const CollectionVisitor& visitor, const MemberFilter& filter)
{
    std::vector<std::string> path;
    std::set<std::string> onPath{root.GetIdentity()};

    CPLDebug(ErrorHandler::DEBUG_KEY, "Traversing collection %s", root.GetDisplayName().c_str());
    TraverseCollection(root, visitor, filter, path, onPath);
}
}  // namespace GeoGrid
