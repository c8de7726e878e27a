#include "deps/asset_index.hpp"
#include "deps/dependency_resolver.hpp"
#include "test_util.hpp"

#include <map>

// Secondary source standing in for a script analyzer: fixed edges for .cs files
class FakeScriptSource : public ReferenceSource {
public:
    size_t index_files(const std::vector<std::string>&) override { return 0; }

    PathSet direct_references_of(const std::string& path) const override {
        auto it = edges.find(path);
        return it == edges.end() ? PathSet{} : it->second;
    }

    bool handles(const std::string& path) const override {
        return path.size() > 3 && path.compare(path.size() - 3, 3, ".cs") == 0;
    }

    std::map<std::string, PathSet> edges;
};

class DependencyResolverTest : public ProjectTest {
protected:
    // Index every .meta written so far
    void index_all(AssetIndex& index) {
        std::vector<std::string> metas;
        for (const auto& e : fs::recursive_directory_iterator(root_)) {
            if (e.path().extension() == ".meta") metas.push_back(e.path().string());
        }
        ASSERT_EQ(index.index_files(metas), 0u);
    }

    ThreadPool pool_{4};
};

TEST_F(DependencyResolverTest, PrefabPullsInItsMaterial) {
    std::string mat = make_guid(2);
    add_asset("Assets/Player.mat", mat, "m_Shader: {fileID: 46, guid: 0000000000000000f000000000000000, type: 0}\n");
    add_asset("Assets/Player.prefab", make_guid(1), "m_Materials:\n  - " + ref_to(mat) + "\n");
    add_asset("Assets/Unrelated.png", make_guid(3), "png");

    AssetIndex index(pool_);
    index_all(index);
    DependencyResolver resolver(index, nullptr, pool_);

    PathSet result = resolver.resolve({abs("Assets/Player.prefab")});
    EXPECT_EQ(result, (PathSet{abs("Assets/Player.prefab"), abs("Assets/Player.mat")}));
}

TEST_F(DependencyResolverTest, TransitiveChainIsFollowed) {
    add_asset("Assets/D.asset", make_guid(4));
    add_asset("Assets/C.asset", make_guid(3), ref_to(make_guid(4)) + "\n");
    add_asset("Assets/B.asset", make_guid(2), ref_to(make_guid(3)) + "\n");
    add_asset("Assets/A.asset", make_guid(1), ref_to(make_guid(2)) + "\n");

    AssetIndex index(pool_);
    index_all(index);
    DependencyResolver resolver(index, nullptr, pool_, 1);

    PathSet result = resolver.resolve({abs("Assets/A.asset")});
    EXPECT_EQ(result.size(), 4u);
    EXPECT_TRUE(result.count(abs("Assets/D.asset")));
}

TEST_F(DependencyResolverTest, CycleTerminates) {
    add_asset("Assets/A.asset", make_guid(1), ref_to(make_guid(2)) + "\n");
    add_asset("Assets/B.asset", make_guid(2), ref_to(make_guid(1)) + "\n");

    AssetIndex index(pool_);
    index_all(index);
    DependencyResolver resolver(index, nullptr, pool_);

    PathSet result = resolver.resolve({abs("Assets/A.asset")});
    EXPECT_EQ(result, (PathSet{abs("Assets/A.asset"), abs("Assets/B.asset")}));
}

TEST_F(DependencyResolverTest, CycleWithRelativeSeedListsEachFileOnce) {
    add_asset("Assets/A.asset", make_guid(1), ref_to(make_guid(2)) + "\n");
    add_asset("Assets/B.asset", make_guid(2), ref_to(make_guid(1)) + "\n");

    AssetIndex index(pool_);
    index_all(index);
    DependencyResolver resolver(index, nullptr, pool_);

    fs::path previous = fs::current_path();
    fs::current_path(root_);
    PathSet result = resolver.resolve({"Assets/A.asset", "./Assets/../Assets/A.asset"});
    fs::current_path(previous);

    EXPECT_EQ(result.size(), 2u);
    EXPECT_EQ(result, (PathSet{abs("Assets/A.asset"), abs("Assets/B.asset")}));
}

TEST_F(DependencyResolverTest, EdgesOutsideTheClosureAreIgnored) {
    // X -> A, but nothing reachable from A leads to X
    add_asset("Assets/A.asset", make_guid(1));
    add_asset("Assets/X.asset", make_guid(9), ref_to(make_guid(1)) + "\n");

    AssetIndex index(pool_);
    index_all(index);
    DependencyResolver resolver(index, nullptr, pool_);

    EXPECT_EQ(resolver.resolve({abs("Assets/A.asset")}), (PathSet{abs("Assets/A.asset")}));
}

TEST_F(DependencyResolverTest, DanglingReferenceIsDropped) {
    add_asset("Assets/A.asset", make_guid(1), ref_to(make_guid(404)) + "\n");

    AssetIndex index(pool_);
    index_all(index);
    DependencyResolver resolver(index, nullptr, pool_);

    EXPECT_EQ(resolver.resolve({abs("Assets/A.asset")}), (PathSet{abs("Assets/A.asset")}));
}

TEST_F(DependencyResolverTest, WideFanOutAcrossManyBatches) {
    std::string hub_text;
    for (int i = 0; i < 100; ++i) {
        std::string rel = "Assets/Leaf" + std::to_string(i) + ".asset";
        add_asset(rel, make_guid(100 + i));
        hub_text += ref_to(make_guid(100 + i)) + "\n";
    }
    add_asset("Assets/Hub.asset", make_guid(1), hub_text);

    AssetIndex index(pool_);
    index_all(index);
    DependencyResolver resolver(index, nullptr, pool_, 8);

    PathSet result = resolver.resolve({abs("Assets/Hub.asset")});
    EXPECT_EQ(result.size(), 101u);
}

TEST_F(DependencyResolverTest, ScriptPassRunsOnceWithoutExpansion) {
    add_asset("Assets/Player.cs", make_guid(5), "class Player {}");
    add_asset("Assets/Player.prefab", make_guid(1), ref_to(make_guid(5), 11500000) + "\n");
    add_asset("Assets/Helper.cs", make_guid(6), "class Helper {}");
    add_asset("Assets/Deep.cs", make_guid(7), "class Deep {}");

    AssetIndex index(pool_);
    index_all(index);

    FakeScriptSource scripts;
    scripts.edges[abs("Assets/Player.cs")] = {abs("Assets/Helper.cs")};
    scripts.edges[abs("Assets/Helper.cs")] = {abs("Assets/Deep.cs")};

    DependencyResolver resolver(index, &scripts, pool_);
    PathSet result = resolver.resolve({abs("Assets/Player.prefab")});

    EXPECT_EQ(result, (PathSet{abs("Assets/Player.prefab"), abs("Assets/Player.cs"),
                               abs("Assets/Helper.cs")}));
}

TEST_F(DependencyResolverTest, DuplicateSeedsCollapse) {
    add_asset("Assets/A.asset", make_guid(1));

    AssetIndex index(pool_);
    index_all(index);
    DependencyResolver resolver(index, nullptr, pool_);

    PathSet result = resolver.resolve({abs("Assets/A.asset"), abs("Assets/A.asset")});
    EXPECT_EQ(result.size(), 1u);
}
