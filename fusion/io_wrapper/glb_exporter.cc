#include "glb_exporter.h"
#include "../settings.h"
#include "../util/errors.h"
#include "../util/geometry.h"

#include <assimp/Exporter.hpp>
#include <assimp/GltfMaterial.h>
#include <assimp/material.h>
#include <assimp/metadata.h>
#include <assimp/scene.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <vector>

namespace scene_fusion {

namespace {

// frustum edges: apex to the four corners, then the image rectangle
const unsigned int kFrustumLines[8][2] = {
    {0, 1}, {0, 2}, {0, 3}, {0, 4},
    {1, 2}, {2, 3}, {3, 4}, {4, 1}
};

aiMatrix4x4 toAiMatrix(const Eigen::Matrix4d& m)
{
    return aiMatrix4x4(
        static_cast<ai_real>(m(0,0)), static_cast<ai_real>(m(0,1)), static_cast<ai_real>(m(0,2)), static_cast<ai_real>(m(0,3)),
        static_cast<ai_real>(m(1,0)), static_cast<ai_real>(m(1,1)), static_cast<ai_real>(m(1,2)), static_cast<ai_real>(m(1,3)),
        static_cast<ai_real>(m(2,0)), static_cast<ai_real>(m(2,1)), static_cast<ai_real>(m(2,2)), static_cast<ai_real>(m(2,3)),
        static_cast<ai_real>(m(3,0)), static_cast<ai_real>(m(3,1)), static_cast<ai_real>(m(3,2)), static_cast<ai_real>(m(3,3)));
}

// OpenCV camera / world axes -> glTF axes
Eigen::Matrix4d flipYZ()
{
    Eigen::Matrix4d F = Eigen::Matrix4d::Identity();
    F(1,1) = -1.0;
    F(2,2) = -1.0;
    return F;
}

// frustum size: a quarter of the spread of the drawn cameras, 0.1 if they coincide
double frustumDepth(const Prediction& prediction, const std::vector<std::size_t>& drawn)
{
    if (drawn.empty()) return 0.1;

    Eigen::Vector3d mean = Eigen::Vector3d::Zero();
    for (std::size_t i : drawn) mean += prediction.views[i].pose.center();
    mean /= static_cast<double>(drawn.size());

    double extent = 0.0;
    for (std::size_t i : drawn) extent = std::max(extent, (prediction.views[i].pose.center() - mean).norm());
    return extent > 1e-6 ? 0.25 * extent : 0.1;
}

aiMesh* makePointMesh(const PointCloud& cloud)
{
    aiMesh* mesh = new aiMesh;
    mesh->mName.Set("points");
    mesh->mMaterialIndex = 0;
    mesh->mPrimitiveTypes = aiPrimitiveType_POINT;

    const unsigned int n = static_cast<unsigned int>(cloud.size());
    mesh->mNumVertices = n;
    mesh->mVertices = new aiVector3D[n];
    mesh->mColors[0] = new aiColor4D[n];
    mesh->mNumFaces = n;
    mesh->mFaces = new aiFace[n];

    for (unsigned int i = 0; i < n; ++i) {
        const Eigen::Vector3f& p = cloud.positions[i];
        const Color3b& c = cloud.colors[i];
        mesh->mVertices[i] = aiVector3D(p.x(), p.y(), p.z());
        mesh->mColors[0][i] = aiColor4D(c[0] / 255.0f, c[1] / 255.0f, c[2] / 255.0f, 1.0f);

        aiFace& face = mesh->mFaces[i];
        face.mNumIndices = 1;
        face.mIndices = new unsigned int[1];
        face.mIndices[0] = i;
    }
    return mesh;
}

aiMesh* makeFrustumMesh(const View& view, double depth, const char* name)
{
    aiMesh* mesh = new aiMesh;
    mesh->mName.Set(name);
    mesh->mMaterialIndex = 0;
    mesh->mPrimitiveTypes = aiPrimitiveType_LINE;

    const CameraIntrinsics& K = view.intrinsics();
    const double w = K.width;
    const double h = K.height;
    const Eigen::Vector3d corners[5] = {
        Eigen::Vector3d::Zero(),
        unproject(K, 0.0, 0.0, depth),
        unproject(K, w, 0.0, depth),
        unproject(K, w, h, depth),
        unproject(K, 0.0, h, depth)
    };

    mesh->mNumVertices = 5;
    mesh->mVertices = new aiVector3D[5];
    for (int i = 0; i < 5; ++i) {
        // vertices live in the node frame, which uses glTF camera axes
        mesh->mVertices[i] = aiVector3D(static_cast<ai_real>(corners[i].x()),
                                        static_cast<ai_real>(-corners[i].y()),
                                        static_cast<ai_real>(-corners[i].z()));
    }

    mesh->mNumFaces = 8;
    mesh->mFaces = new aiFace[8];
    for (int i = 0; i < 8; ++i) {
        aiFace& face = mesh->mFaces[i];
        face.mNumIndices = 2;
        face.mIndices = new unsigned int[2];
        face.mIndices[0] = kFrustumLines[i][0];
        face.mIndices[1] = kFrustumLines[i][1];
    }
    return mesh;
}

aiCamera* makeCamera(const View& view, const char* name)
{
    const CameraIntrinsics& K = view.intrinsics();

    aiCamera* cam = new aiCamera;
    cam->mName.Set(name);
    cam->mPosition = aiVector3D(0, 0, 0);
    cam->mUp = aiVector3D(0, 1, 0);
    cam->mLookAt = aiVector3D(0, 0, -1);
    cam->mHorizontalFOV = static_cast<float>(2.0 * std::atan(0.5 * K.width / K.fx));
    cam->mAspect = static_cast<float>(K.width) / static_cast<float>(K.height);
    cam->mClipPlaneNear = 0.01f;
    cam->mClipPlaneFar = 1000.0f;
    return cam;
}

}

ByteBuffer encodeSceneGlb(const PointCloud& cloud, const Prediction& prediction)
{
    prediction.requireViews("glb export");

    if (cloud.size() >= std::numeric_limits<unsigned int>::max())
        throw ExportError("glb: point cloud too large");

    const bool hasPoints = !cloud.empty();
    const std::vector<std::size_t> drawn = prediction.consistentViews("glb");
    const unsigned int numViews = static_cast<unsigned int>(drawn.size());
    const unsigned int pointMeshes = hasPoints ? 1 : 0;
    const double depth = frustumDepth(prediction, drawn);

    aiScene scene;

    scene.mNumMaterials = 1;
    scene.mMaterials = new aiMaterial*[scene.mNumMaterials];
    scene.mMaterials[0] = new aiMaterial;
    auto& mtl = *scene.mMaterials[0];
    {
        aiString name;
        name.Set("VertexColor");
        mtl.AddProperty(&name, AI_MATKEY_NAME);

        aiColor4D const albedo(1, 1, 1, 1);
        mtl.AddProperty(&albedo, 1, AI_MATKEY_BASE_COLOR);

        const ai_real opacity = 1;
        mtl.AddProperty(&opacity, 1, AI_MATKEY_OPACITY);

        aiString alphaMode("OPAQUE");
        mtl.AddProperty(&alphaMode, AI_MATKEY_GLTF_ALPHAMODE);
    }

    scene.mNumMeshes = pointMeshes + numViews;
    scene.mMeshes = new aiMesh*[scene.mNumMeshes];
    if (hasPoints)
        scene.mMeshes[0] = makePointMesh(cloud);

    scene.mNumCameras = numViews;
    scene.mCameras = new aiCamera*[numViews];

    scene.mRootNode = new aiNode;
    aiNode& root = *scene.mRootNode;
    root.mName.Set("scene");
    root.mParent = nullptr;
    root.mTransformation = toAiMatrix(flipYZ());

    root.mNumChildren = pointMeshes + numViews;
    root.mChildren = new aiNode*[root.mNumChildren];

    if (hasPoints) {
        aiNode* pointsNode = new aiNode;
        pointsNode->mName.Set("points");
        pointsNode->mParent = &root;
        pointsNode->mNumMeshes = 1;
        pointsNode->mMeshes = new unsigned int[1];
        pointsNode->mMeshes[0] = 0;
        root.mChildren[0] = pointsNode;
    }

    char name[32];
    for (unsigned int i = 0; i < numViews; ++i) {
        const View& view = prediction.views[drawn[i]];
        std::snprintf(name, sizeof(name), "camera_%03zu", drawn[i]);

        const unsigned int meshIdx = pointMeshes + i;
        scene.mMeshes[meshIdx] = makeFrustumMesh(view, depth, name);
        scene.mCameras[i] = makeCamera(view, name);

        aiNode* node = new aiNode;
        node->mName.Set(name);
        node->mParent = &root;
        node->mTransformation = toAiMatrix(view.pose.camToWorld().matrix() * flipYZ());
        node->mNumMeshes = 1;
        node->mMeshes = new unsigned int[1];
        node->mMeshes[0] = meshIdx;

        const CameraIntrinsics& K = view.intrinsics();
        node->mMetaData = aiMetadata::Alloc(8);
        node->mMetaData->Set(0, "fx", K.fx);
        node->mMetaData->Set(1, "fy", K.fy);
        node->mMetaData->Set(2, "cx", K.cx);
        node->mMetaData->Set(3, "cy", K.cy);
        node->mMetaData->Set(4, "width", static_cast<int32_t>(K.width));
        node->mMetaData->Set(5, "height", static_cast<int32_t>(K.height));
        node->mMetaData->Set(6, "pose_source", aiString(poseSourceName(view.pose.source())));
        node->mMetaData->Set(7, "units", aiString(unitsName(prediction.units)));

        root.mChildren[pointMeshes + i] = node;
    }

    Assimp::Exporter exporter;
    const aiExportDataBlob* blob = exporter.ExportToBlob(&scene, "glb2", 0);
    if (blob == nullptr || blob->size == 0)
        throw ExportError(std::string("glb: assimp failed: ") + exporter.GetErrorString());

    const std::uint8_t* data = static_cast<const std::uint8_t*>(blob->data);
    ByteBuffer res(data, data + blob->size);

    if (printExportInfo)
        std::printf("EXPORT: glb, %zu points, %u cameras (%s), %zu bytes\n", cloud.size(), numViews,
                    unitsName(prediction.units), res.size());
    return res;
}

}
