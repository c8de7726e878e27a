#include "deps/asset_index.hpp"
#include "test_util.hpp"

class AssetIndexTest : public ProjectTest {
protected:
    ThreadPool pool_{4};
};

TEST_F(AssetIndexTest, IndexesAssetAndMetaPathsAlike) {
    std::string mat = make_guid(1);
    std::string tex = make_guid(2);
    add_asset("Assets/Player.mat", mat, "shader data");
    add_asset("Assets/Player.png", tex, "png");

    AssetIndex index(pool_);
    size_t failed = index.index_files({abs("Assets/Player.mat"), abs("Assets/Player.png.meta")});

    EXPECT_EQ(failed, 0u);
    EXPECT_EQ(index.guid_count(), 2u);
    ASSERT_TRUE(index.resolve_guid(mat).has_value());
    EXPECT_EQ(*index.resolve_guid(mat), abs("Assets/Player.mat"));
    EXPECT_EQ(*index.resolve_guid(tex), abs("Assets/Player.png"));
    EXPECT_FALSE(index.resolve_guid(make_guid(99)).has_value());
}

TEST_F(AssetIndexTest, DirectReferencesResolveAndDropUnknown) {
    std::string prefab = make_guid(10);
    std::string mat    = make_guid(11);
    std::string ghost  = make_guid(12);
    add_asset("Assets/Player.mat", mat);
    add_asset("Assets/Player.prefab", prefab,
              "m_Materials:\n"
              "  - " + ref_to(mat) + "\n"
              "  - " + ref_to(mat, 7) + "\n"
              "  - " + ref_to(ghost) + "\n");

    AssetIndex index(pool_);
    index.index_files({abs("Assets/Player.mat.meta"), abs("Assets/Player.prefab.meta")});

    PathSet refs = index.direct_references_of(abs("Assets/Player.prefab"));
    ASSERT_EQ(refs.size(), 1u);
    EXPECT_EQ(*refs.begin(), abs("Assets/Player.mat"));
}

TEST_F(AssetIndexTest, MetaWithoutGuidIsIndexedWithoutGuid) {
    write("Assets/Folder.meta", "fileFormatVersion: 2\nfolderAsset: yes\n");

    AssetIndex index(pool_);
    EXPECT_EQ(index.index_files({abs("Assets/Folder.meta")}), 0u);
    EXPECT_EQ(index.guid_count(), 0u);
    EXPECT_EQ(index.size(), 1u);
}

TEST_F(AssetIndexTest, ManyFilesIndexedConcurrently) {
    std::vector<std::string> metas;
    for (int i = 0; i < 200; ++i) {
        std::string rel = "Assets/Gen/item" + std::to_string(i) + ".asset";
        add_asset(rel, make_guid(1000 + i));
        metas.push_back(abs(rel + ".meta"));
    }

    AssetIndex index(pool_);
    EXPECT_EQ(index.index_files(metas), 0u);
    EXPECT_EQ(index.guid_count(), 200u);
    EXPECT_EQ(*index.resolve_guid(make_guid(1123)), abs("Assets/Gen/item123.asset"));
}

TEST_F(AssetIndexTest, HandlesEveryPath) {
    AssetIndex index(pool_);
    EXPECT_TRUE(index.handles("anything.cs"));
    EXPECT_TRUE(index.handles("Assets/a.prefab"));
}
