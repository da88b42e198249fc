#include <cassert>
#include <vector>
#include <queue>
#include <set>
#include <random>
#include <algorithm>
#include <functional>
#include <iostream>
#include <cstdint>

#include "../src/heap.hpp"

static std::mt19937_64 rng(12345);

// Interleaved insert/extract/replace_root against std::priority_queue.
template <class Cmp>
void check_against_pq(HeapMode mode) {
    BinaryHeap<std::uint64_t> h(mode);
    std::priority_queue<std::uint64_t, std::vector<std::uint64_t>, Cmp> pq;
    std::uniform_int_distribution<int> op(0, 3); // 0,1:insert 2:extract 3:replace_root
    for (int i=0;i<50000;++i){
        int o = op(rng);
        if (o<=1){
            auto x = rng() & 0xffff; // keep duplicates around
            h.insert(x); pq.push(x);
        } else if (o==2){
            if (!pq.empty()){ auto top=h.extract(); assert(top==pq.top()); pq.pop(); }
            else {
                bool threw=false;
                try { h.extract(); } catch (const EmptyHeapError&) { threw=true; }
                assert(threw);
            }
        } else if (!pq.empty()){
            auto x = rng() & 0xffff;
            auto old = h.replace_root(x);
            assert(old==pq.top());
            pq.pop(); pq.push(x);
        }
        assert(h.size()==pq.size());
        if (!pq.empty()) assert(h.peek()==pq.top());
    }
    while(!pq.empty()){
        auto top = h.extract();
        assert(top==pq.top());
        pq.pop();
    }
    assert(h.empty());
}

// Bottom-up build must agree with std::make_heap on what comes out.
void check_build() {
    for (std::size_t n : {0u, 1u, 2u, 3u, 7u, 8u, 1000u, 4097u}){
        std::vector<std::uint64_t> v(n);
        for (auto &x : v) x = rng() % 64;
        auto h = BinaryHeap<std::uint64_t>::build(v);
        assert(h.is_heap());
        auto ref = v;
        std::make_heap(ref.begin(), ref.end());
        while(!ref.empty()){
            std::pop_heap(ref.begin(), ref.end());
            auto top = h.extract();
            assert(top==ref.back());
            ref.pop_back();
        }
        assert(h.empty());
    }
}

// update/remove against a multiset holding the same values.
void check_update_remove() {
    BinaryHeap<std::uint64_t> h(HeapMode::Min);
    std::multiset<std::uint64_t> m;
    for (int i=0;i<2000;++i){ auto x=rng()%5000; h.insert(x); m.insert(x); }
    std::uniform_int_distribution<int> op(0, 2); // 0:update 1:remove 2:insert
    for (int i=0;i<20000;++i){
        auto k = rng()%5000;
        int o = op(rng);
        if (o==0){
            auto nv = rng()%5000;
            bool ok = h.update(k, nv);
            auto it = m.find(k);
            assert(ok == (it!=m.end()));
            if (ok){ m.erase(it); m.insert(nv); }
        } else if (o==1){
            bool ok = h.remove(k);
            auto it = m.find(k);
            assert(ok == (it!=m.end()));
            if (ok) m.erase(it);
        } else {
            h.insert(k); m.insert(k);
        }
        assert(h.size()==m.size());
        if (!m.empty()) assert(h.peek()==*m.begin());
    }
    assert(h.is_heap());
    for (auto x : m){ auto top = h.extract(); assert(top==x); }
}

int main(){
    check_against_pq<std::less<std::uint64_t>>(HeapMode::Max);
    check_against_pq<std::greater<std::uint64_t>>(HeapMode::Min);
    check_build();
    check_update_remove();
    std::cout << "OK\n";
    return 0;
}
