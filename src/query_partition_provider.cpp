#include "query_partition_provider.hpp"
#include "util.hpp"

namespace partition_query {

std::vector<KeyRange>
DefaultQueryPartitionProvider::getProvidedRanges(const QuerySpec& query,
                                                 const PartitionKeyDefinition& definition,
                                                 bool /*enableCrossPartitionQuery*/)
{
    // Only single-path keys hash to a single point.
    if (query.partitionKeyValue && definition.paths.size() == 1) {
        return {KeyRange::point(effectivePartitionKey(*query.partitionKeyValue))};
    }
    return {KeyRange::fullRange()};
}

} // namespace partition_query
