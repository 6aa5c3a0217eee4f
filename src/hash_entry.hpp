#pragma once
#include <cstdint>
#include <utility>

// One node of a collision chain. The chain owns every node after it; nodes
// are created and destroyed only by the HashTable that links them.
template <typename K, typename V>
struct HashEntry
{
    template <class KArg, class VArg>
    HashEntry(KArg &&k, std::uint32_t h, VArg &&v, HashEntry *n)
        : key(std::forward<KArg>(k)), hash(h), value(std::forward<VArg>(v)), next(n)
    {
    }

    const K key;
    const std::uint32_t hash;
    V value;
    HashEntry *next;

    // Searches this node and its successors. Chains are sorted by hash, so
    // the walk stops at the first node whose hash is past `h`.
    template <class Eq>
    HashEntry *find(const K &k, std::uint32_t h, const Eq &eq)
    {
        for (HashEntry *n = this; n; n = n->next)
        {
            if (n->hash == h && eq(n->key, k))
                return n;
            if (n->hash > h)
                break;
        }
        return nullptr;
    }
};

// Deletes a whole chain iteratively; chains can be long under bad hashes.
template <typename K, typename V>
void destroy_chain(HashEntry<K, V> *head) noexcept
{
    while (head)
    {
        HashEntry<K, V> *t = head;
        head = head->next;
        delete t;
    }
}
